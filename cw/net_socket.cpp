#include "net_socket.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <unistd.h>
#include <netdb.h>
#include <errno.h>
#include <strings.h>
#include <string.h>
#include <poll.h>
#include <algorithm>

#define CW_EPOLL_FLAGS (EPOLLIN|EPOLLET|EPOLLRDHUP|EPOLLHUP|EPOLLERR)

using namespace cw;

///////////////////////////////////////////////////////////////////////////
// net_wtr

net_wtr::net_wtr()
: rsv_( 0 )
{
}

void net_wtr::reset()
{
  buf_.clear();
  rsv_ = 0;
}

void net_wtr::detach( std::string& res )
{
  res.swap( buf_ );
  reset();
}

void net_wtr::add( char val )
{
  buf_.push_back( val );
}

void net_wtr::add( str val )
{
  buf_.append( val.str_, val.len_ );
}

void net_wtr::add( net_wtr& msg )
{
  buf_.append( msg.buf_ );
  msg.reset();
}

char *net_wtr::reserve( size_t len )
{
  rsv_ = buf_.size();
  buf_.resize( rsv_ + len );
  return &buf_[rsv_];
}

void net_wtr::advance( size_t len )
{
  buf_.resize( rsv_ + len );
}

size_t net_wtr::size() const
{
  return buf_.size();
}

void net_wtr::copy( std::string& res ) const
{
  res = buf_;
}

///////////////////////////////////////////////////////////////////////////
// net_loop

net_parser::~net_parser()
{
}

net_loop::net_loop()
: fd_(-1)
{
  __builtin_memset( evarr_, 0, sizeof( evarr_ ) );
}

net_loop::~net_loop()
{
  if ( fd_ >= 0 ) {
    ::close( fd_ );
  }
}

bool net_loop::init()
{
  if ( fd_ >= 0 ) {
    return true;
  }
  fd_ = ::epoll_create1( EPOLL_CLOEXEC );
  if ( fd_ < 0 ) {
    return set_err_msg( "failed to create epoll", errno );
  }
  return true;
}

// edge triggered, with write readiness only while bytes are queued
void net_loop::add( tcp_connect *cptr, bool is_send )
{
  epoll_event ev[1];
  __builtin_memset( ev, 0, sizeof( ev ) );
  ev->events   = CW_EPOLL_FLAGS | ( is_send ? EPOLLOUT : 0 );
  ev->data.ptr = cptr;
  int evop = cptr->get_in_loop() ? EPOLL_CTL_MOD : EPOLL_CTL_ADD;
  if ( 0 > epoll_ctl( fd_, evop, cptr->get_fd(), ev ) ) {
    cptr->set_err_msg( "failed to add socket to epoll", errno );
    return;
  }
  cptr->set_in_loop( true );
}

void net_loop::del( tcp_connect *cptr )
{
  if ( cptr->get_in_loop() ) {
    epoll_event ev[1];
    __builtin_memset( ev, 0, sizeof( ev ) );
    if ( 0 > epoll_ctl( fd_, EPOLL_CTL_DEL, cptr->get_fd(), ev ) ) {
      set_err_msg( "failed to remove socket from epoll", errno );
    }
    cptr->set_in_loop( false );
  }
}

bool net_loop::poll( int timeout )
{
  int nfds = epoll_wait( fd_, evarr_, max_events_, timeout );
  for( int i = 0; i < nfds; ++i ) {
    tcp_connect *cptr = static_cast<tcp_connect*>( evarr_[i].data.ptr );
    cptr->poll();
    if ( cptr->get_is_err() ) {
      cptr->teardown();
    }
  }
  return nfds > 0;
}

///////////////////////////////////////////////////////////////////////////
// tcp_connect

tcp_connect::tcp_connect()
: fd_( -1 ),
  port_( -1 ),
  inl_( false ),
  cto_( 10L*CW_NSECS_IN_SEC ),
  lp_( nullptr ),
  np_( nullptr ),
  soff_( 0 ),
  rsz_( 0 )
{
}

tcp_connect::~tcp_connect()
{
  teardown();
}

void tcp_connect::set_host( const std::string& hostn )
{
  host_ = hostn;
}

std::string tcp_connect::get_host() const
{
  return host_;
}

void tcp_connect::set_port( int port )
{
  port_ = port;
}

int tcp_connect::get_port() const
{
  return port_;
}

void tcp_connect::set_connect_timeout( int64_t nsecs )
{
  cto_ = nsecs;
}

int64_t tcp_connect::get_connect_timeout() const
{
  return cto_;
}

void tcp_connect::set_net_loop( net_loop *lp )
{
  lp_ = lp;
}

void tcp_connect::set_net_parser( net_parser *np )
{
  np_ = np;
}

int tcp_connect::get_fd() const
{
  return fd_;
}

void tcp_connect::set_in_loop( bool inl )
{
  inl_ = inl;
}

bool tcp_connect::get_in_loop() const
{
  return inl_;
}

bool tcp_connect::get_is_send() const
{
  return soff_ < sbuf_.size();
}

void tcp_connect::teardown()
{
  if ( fd_ >= 0 ) {
    if ( lp_ ) {
      lp_->del( this );
    }
    ::close( fd_ );
    fd_ = -1;
  }
  inl_ = false;
  sbuf_.clear();
  soff_ = 0;
  rsz_  = 0;
}

// wait for a non-blocking connect to finish; returns errno style code
static int wait_connect( int fd, int64_t end_ts )
{
  for(;;) {
    int64_t wait_ms = ( end_ts - get_now() ) / CW_NSECS_IN_MSEC;
    if ( wait_ms <= 0 ) {
      return ETIMEDOUT;
    }
    pollfd pfd[1];
    pfd->fd      = fd;
    pfd->events  = POLLOUT;
    pfd->revents = 0;
    int rc = ::poll( pfd, 1, (int)std::min( wait_ms, (int64_t)1000 ) );
    if ( rc < 0 && errno != EINTR ) {
      return errno;
    }
    if ( rc > 0 ) {
      int ec = 0;
      socklen_t elen = sizeof( ec );
      if ( 0 != ::getsockopt( fd, SOL_SOCKET, SO_ERROR, &ec, &elen ) ) {
        return errno;
      }
      return ec;
    }
  }
}

// try each resolved address in turn until one accepts
bool tcp_connect::init()
{
  teardown();
  reset_err();
  addrinfo hints[1];
  __builtin_memset( hints, 0, sizeof( addrinfo ) );
  hints->ai_family   = AF_UNSPEC;
  hints->ai_socktype = SOCK_STREAM;
  hints->ai_protocol = IPPROTO_TCP;
  std::string port = std::to_string( port_ );
  addrinfo *ainfo = nullptr;
  int rc = ::getaddrinfo( host_.c_str(), port.c_str(), hints, &ainfo );
  if ( rc != 0 ) {
    return set_err( e_err_transient, 0, "failed to resolve host=" + host_ +
                    " [" + gai_strerror( rc ) + "]" );
  }
  int64_t end_ts = get_now() + cto_;
  int fd = -1, ec = 0;
  for( addrinfo *ap = ainfo; ap && fd < 0; ap = ap->ai_next ) {
    fd = ::socket( ap->ai_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC,
                   IPPROTO_TCP );
    if ( fd < 0 ) {
      ec = errno;
      continue;
    }
    ec = 0;
    if ( 0 != ::connect( fd, ap->ai_addr, ap->ai_addrlen ) ) {
      ec = errno == EINPROGRESS ? wait_connect( fd, end_ts ) : errno;
    }
    if ( ec ) {
      ::close( fd );
      fd = -1;
    }
  }
  ::freeaddrinfo( ainfo );
  if ( fd < 0 ) {
    std::string emsg = "failed to connect host=" + host_ + ":" + port;
    if ( ec ) {
      emsg += " [";
      emsg += strerror( ec );
      emsg += ']';
    }
    return set_err( e_err_transient, 0, emsg );
  }
  fd_ = fd;
  if ( lp_ ) {
    lp_->add( this, false );
  }
  return !get_is_err();
}

void tcp_connect::add_send( net_wtr& msg )
{
  bool was_idle = !get_is_send();
  if ( was_idle ) {
    sbuf_.clear();
    soff_ = 0;
    msg.detach( sbuf_ );
  } else {
    std::string tmp;
    msg.detach( tmp );
    sbuf_.append( tmp );
  }
  if ( was_idle && lp_ && fd_ >= 0 ) {
    lp_->add( this, true );
  }
}

void tcp_connect::poll()
{
  if ( get_is_send() ) {
    poll_send();
  }
  poll_recv();
}

void tcp_connect::poll_send()
{
  while( get_is_send() && !get_is_err() ) {
    ssize_t rc = ::send( fd_, &sbuf_[soff_], sbuf_.size() - soff_,
                         MSG_NOSIGNAL );
    if ( rc <= 0 ) {
      if ( rc == 0 || ( errno != EAGAIN && errno != EINTR ) ) {
        poll_error( false, rc == 0 ? 0 : errno );
      }
      return;
    }
    soff_ += rc;
  }
  if ( !get_is_send() && !get_is_err() ) {
    sbuf_.clear();
    soff_ = 0;
    if ( lp_ && fd_ >= 0 ) {
      lp_->add( this, false );
    }
  }
}

void tcp_connect::poll_recv()
{
  while( !get_is_err() ) {
    if ( rdr_.size() - rsz_ < buf_len ) {
      rdr_.resize( rsz_ + buf_len );
    }
    ssize_t rc = ::recv( fd_, &rdr_[rsz_], buf_len, 0 );
    if ( rc <= 0 ) {
      if ( rc == 0 || ( errno != EAGAIN && errno != EINTR ) ) {
        poll_error( true, rc == 0 ? 0 : errno );
      }
      return;
    }
    rsz_ += rc;

    // hand every complete message to the parser
    size_t idx = 0, rlen = 0;
    while( np_ && idx < rsz_ && np_->parse( &rdr_[idx], rsz_ - idx, rlen ) ) {
      idx += rlen;
    }
    if ( idx ) {
      rsz_ -= idx;
      __builtin_memmove( &rdr_[0], &rdr_[idx], rsz_ );
    }
  }
}

void tcp_connect::poll_error( bool is_read, int ec )
{
  std::string emsg = is_read ? "fail to read" : "fail to write";
  emsg += " [";
  emsg += ec ? strerror( ec ) : "connection closed";
  emsg += ']';
  set_err( e_err_transient, 0, emsg );
}

///////////////////////////////////////////////////////////////////////////
// http_request

void http_request::init( const char *method, const char *endpoint )
{
  add( method );
  add( ' ' );
  add( endpoint );
  add( " HTTP/1.1\r\n" );
}

void http_request::add_hdr( const char *hdr, str val )
{
  add( hdr );
  add( ": " );
  add( val );
  add( "\r\n" );
}

void http_request::add_hdr( const char *hdr, uint64_t ival )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *val = uint_to_str( ival, end );
  add_hdr( hdr, str( val, end - val ) );
}

void http_request::commit( net_wtr& body )
{
  add_hdr( "Content-Length", body.size() );
  add( "\r\n" );
  add( body );
}

///////////////////////////////////////////////////////////////////////////
// http_client

static inline bool find( const char ch, const char *&ptr, const char *end )
{
  for(;ptr!=end;++ptr) {
    if ( *ptr == ch ) return true;
  }
  return false;
}

static bool is_hdr( const char *hdr, size_t len, const char *name )
{
  return len == __builtin_strlen( name ) &&
         0 == ::strncasecmp( hdr, name, len );
}

// returns false until a complete response is buffered
bool http_client::parse( const char *ptr, size_t len, size_t& res )
{
  const char CR = (char)13;
  const char LF = (char)10;

  // status line "HTTP/1.1 200 OK"
  const char *beg = ptr;
  const char *end = &ptr[len];
  if ( !find( ' ', ptr, end ) ) return false;
  const char *stp = ++ptr;
  if ( !find( ' ', ptr, end ) ) return false;
  int status = (int)str_to_uint( stp, ptr - stp );
  const char *msg = ++ptr;
  if ( !find( CR, ptr, end ) ) return false;
  const char *msg_end = ptr;
  if ( ++ptr == end || *ptr != LF ) return false;

  // header lines up to the empty line
  size_t clen = 0;
  for(++ptr;;) {
    if ( &ptr[2] > end ) return false;
    if ( ptr[0] == CR && ptr[1] == LF ) {
      ptr += 2;
      break;
    }
    const char *hdr = ptr;
    if ( !find( ':', ptr, end ) ) return false;
    const char *hdr_end = ptr;
    for( ++ptr; ptr != end && *ptr == ' '; ++ptr );
    const char *val = ptr;
    if ( !find( CR, ptr, end ) ) return false;
    if ( is_hdr( hdr, hdr_end - hdr, "Content-Length" ) ) {
      clen = str_to_uint( val, ptr - val );
    }
    if ( ++ptr == end || *ptr != LF ) return false;
    ++ptr;
  }

  // body
  if ( (size_t)( end - ptr ) < clen ) return false;
  parse_status( status, msg, msg_end - msg );
  parse_content( ptr, clen );
  res = &ptr[clen] - beg;
  return true;
}

void http_client::parse_status( int, const char *, size_t )
{
}

void http_client::parse_content( const char *, size_t )
{
}

///////////////////////////////////////////////////////////////////////////
// json_wtr

json_wtr::json_wtr()
: first_( true )
{
}

void json_wtr::reset()
{
  net_wtr::reset();
  first_ = true;
  st_.clear();
}

// comma before every element but the first of its container
void json_wtr::add_sep()
{
  if ( !first_ ) add( ',' );
  first_ = false;
}

void json_wtr::open( type_t t )
{
  add( t == e_obj ? '{' : '[' );
  first_ = true;
  st_.push_back( t );
}

void json_wtr::pop()
{
  add( st_.back() == e_obj ? '}' : ']' );
  st_.pop_back();
  first_ = false;
}

void json_wtr::add_key( str key, str val )
{
  add_sep();
  add_text( key );
  add( ':' );
  add_text( val );
}

void json_wtr::add_key( str key, uint64_t ival )
{
  add_sep();
  add_text( key );
  add( ':' );
  add_uint( ival );
}

void json_wtr::add_key( str key, type_t t )
{
  add_sep();
  add_text( key );
  add( ':' );
  open( t );
}

void json_wtr::add_val( str val )
{
  add_sep();
  add_text( val );
}

void json_wtr::add_val( uint64_t ival )
{
  add_sep();
  add_uint( ival );
}

void json_wtr::add_val( type_t t )
{
  add_sep();
  open( t );
}

// key pairs are stored as an array of 64 byte values
void json_wtr::add_val( const key_pair& kp )
{
  add_val( e_arr );
  for( unsigned i=0; i!=key_pair::len; ++i ) {
    add_val( (uint64_t)kp.data()[i] );
  }
  pop();
}

void json_wtr::add_val( const hash& pk )
{
  add_val_enc_base58( str( pk.data(), hash::len ) );
}

void json_wtr::add_val( const signature& sig )
{
  add_val_enc_base58( str( sig.data(), signature::len ) );
}

void json_wtr::add_val_enc_base58( str val )
{
  add_sep();
  add( '"' );
  size_t rsv_len = val.len_ + val.len_;
  char *tgt = reserve( rsv_len );
  advance( enc_base58( (const uint8_t*)val.str_,
        val.len_, (uint8_t*)tgt, rsv_len ) );
  add( '"' );
}

void json_wtr::add_val_enc_base64( str val )
{
  add_sep();
  add( '"' );
  char *tgt = reserve( enc_base64_len( val.len_ ) );
  advance( enc_base64( (const uint8_t*)val.str_, val.len_, (uint8_t*)tgt ) );
  add( '"' );
}

void json_wtr::add_uint( uint64_t ival )
{
  char buf[32], *end = &buf[sizeof(buf)];
  char *val = uint_to_str( ival, end );
  add( str( val, end - val ) );
}

void json_wtr::add_text( str val )
{
  add( '"' );
  add( val );
  add( '"' );
}
