#include "jtree.hpp"
#include <ctype.h>

using namespace cw;

jtree::jtree()
: key_( 0 ), err_( false ), buf_( nullptr  )
{
  nv_.resize( 1 );
  __builtin_memset( &nv_[0], 0, sizeof( node ) );
}

// characters that may appear in a json number
static inline bool is_num( char c )
{
  return isdigit( (unsigned char)c ) || c == '.' || c == '-' ||
         c == 'e' || c == 'E' || c == '+';
}

void jtree::parse( const char *cptr, size_t sz )
{
  buf_ = cptr;
  key_ = 0;
  err_ = false;
  nv_.resize( 1 );
  st_.clear();

  const char *eptr = &cptr[sz];
  while( cptr != eptr && !err_ ) {
    unsigned char ch = (unsigned char)*cptr;
    if ( ch == '{' ) {
      start( e_obj );
      ++cptr;
    } else if ( ch == '[' ) {
      start( e_arr );
      ++cptr;
    } else if ( ch == '}' || ch == ']' ) {
      end();
      ++cptr;
    } else if ( ch == '"' ) {
      const char *txt = ++cptr;
      for( ; cptr != eptr && *cptr != '"'; ++cptr ) {
        // escaped characters are kept verbatim
        if ( *cptr == '\\' && &cptr[1] != eptr ) ++cptr;
      }
      if ( cptr == eptr ) {
        err_ = true;
        break;
      }
      const char *etxt = cptr++;
      // peek if this is a key
      const char *pk = cptr;
      while( pk != eptr && isspace( (unsigned char)*pk ) ) ++pk;
      if ( pk != eptr && *pk == ':' && !st_.empty() &&
           get_type( st_.back() ) == e_obj && !key_ ) {
        key_ = new_node( e_val, txt-buf_, etxt-txt );
        cptr = ++pk;
      } else {
        add_text( txt, etxt );
      }
    } else if ( ch == '-' || isdigit( ch ) ) {
      const char *txt = cptr;
      while( cptr != eptr && is_num( *cptr ) ) ++cptr;
      add_text( txt, cptr );
    } else if ( isalpha( ch ) ) {
      const char *txt = cptr;
      while( cptr != eptr && isalpha( (unsigned char)*cptr ) ) ++cptr;
      add_text( txt, cptr );
    } else {
      // whitespace, commas and stray colons
      ++cptr;
    }
  }
}

bool jtree::is_valid() const
{
  return !err_ && nv_.size()>1 && st_.empty();
}

uint32_t jtree::new_node( type_t t, uint32_t i, uint32_t j )
{
  uint32_t nxt = nv_.size();
  nv_.resize( 1 + nxt );
  node& nd = nv_[nxt];
  nd.type_ = t;
  nd.next_ = 0;
  nd.h_    = i;
  nd.t_    = j;
  return nxt;
}

void jtree::add_tail( uint32_t val )
{
  node& obj = nv_[st_.back()];
  if ( obj.t_ ) {
    nv_[obj.t_].next_ = val;
    obj.t_ = val;
  } else {
    obj.h_ = obj.t_ = val;
  }
}

void jtree::add( uint32_t val )
{
  if ( st_.empty() ) {
    // only a single root element is allowed
    if ( val != 1 ) err_ = true;
    return;
  }
  if ( get_type( st_.back() ) == e_obj ) {
    if ( !key_ ) {
      err_ = true;
      return;
    }
    uint32_t kvidx = new_node( e_keyval, key_, val );
    key_ = 0;
    add_tail( kvidx );
  } else {
    add_tail( val );
  }
}

void jtree::start( type_t t )
{
  uint32_t idx = new_node( t, 0, 0 );
  add( idx );
  st_.push_back( idx );
}

void jtree::end()
{
  if ( st_.empty() ) {
    err_ = true;
  } else {
    st_.pop_back();
  }
}

void jtree::add_text( const char *txt, const char *etxt )
{
  add( new_node( e_val, txt-buf_, etxt-txt ) );
}

uint32_t jtree::find_val( uint32_t obj, str key ) const
{
  if ( obj == 0 || get_type( obj ) != e_obj ) {
    return 0;
  }
  for( uint32_t it=get_first(obj); it; it = get_next(it) ) {
    if ( key == get_str( get_key( it ) ) ) {
      return get_val( it );
    }
  }
  return 0;
}
