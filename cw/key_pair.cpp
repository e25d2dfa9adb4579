#include "key_pair.hpp"
#include "jtree.hpp"
#include "mem_map.hpp"
#include "misc.hpp"
#include <openssl/evp.h>
#include <ctype.h>

using namespace cw;

hash::hash()
{
  zero();
}

hash::hash( const hash& obj )
{
  *this = obj;
}

hash& hash::operator=( const hash& obj )
{
  i_[0] = obj.i_[0];
  i_[1] = obj.i_[1];
  i_[2] = obj.i_[2];
  i_[3] = obj.i_[3];
  return *this;
}

bool hash::operator==( const hash& obj) const
{
  return i_[0] == obj.i_[0] &&
    i_[1] == obj.i_[1] &&
    i_[2] == obj.i_[2] &&
    i_[3] == obj.i_[3];
}

bool hash::operator!=( const hash& obj) const
{
  return !( *this == obj );
}

bool hash::operator<( const hash& obj) const
{
  return __builtin_memcmp( pk_, obj.pk_, len ) < 0;
}

void hash::zero()
{
  i_[0] = i_[1] = i_[2] = i_[3] = 0UL;
}

bool hash::is_zero() const
{
  return 0 == ( i_[0] | i_[1] | i_[2] | i_[3] );
}

bool hash::init_from_file( const std::string& file )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    return false;
  }
  // tolerate trailing newline written by editors
  size_t sz = mp.size();
  while( sz && isspace( (unsigned char)mp.data()[sz-1] ) ) --sz;
  return init_from_text( str( mp.data(), sz ) );
}

bool hash::init_from_text( const std::string& buf )
{
  return init_from_text( str( buf ) );
}

// keys shorter than 32 bytes are right-aligned (leading zero bytes)
bool hash::init_from_text( str buf )
{
  uint8_t tmp[len];
  int n = cw::dec_base58( (const uint8_t*)buf.str_, buf.len_, tmp, len );
  if ( n <= 0 ) {
    return false;
  }
  zero();
  __builtin_memcpy( &pk_[len-n], tmp, n );
  return true;
}

void hash::init_from_buf( const uint8_t *pk )
{
  __builtin_memcpy( pk_, pk, len );
}

int hash::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return cw::enc_base58( pk_, len, buf, buflen );
}

int hash::enc_base58( std::string& res ) const
{
  uint8_t buf[64];
  int n = enc_base58( buf, sizeof( buf ) );
  res.assign( (const char*)buf, n );
  return n;
}

std::string hash::as_string() const
{
  std::string res;
  enc_base58( res );
  return res;
}

pub_key::pub_key()
{
}

pub_key::pub_key( const pub_key& obj )
: hash( obj )
{
}

pub_key::pub_key( const key_pair& kp )
{
  kp.get_pub_key( *this );
}

pub_key& pub_key::operator=( const pub_key& pk )
{
  return (pub_key&)hash::operator=( pk );
}

bool key_pair::gen()
{
  EVP_PKEY *pkey = NULL;
  EVP_PKEY_CTX *pctx = EVP_PKEY_CTX_new_id( EVP_PKEY_ED25519, NULL );
  if ( !pctx ) {
    return false;
  }
  bool ok = 0 < EVP_PKEY_keygen_init( pctx ) &&
            0 < EVP_PKEY_keygen( pctx, &pkey );
  EVP_PKEY_CTX_free( pctx );
  if ( !ok ) {
    return false;
  }
  size_t len1[] = { pub_key::len };
  size_t len2[] = { pub_key::len };
  ok = 0 < EVP_PKEY_get_raw_private_key( pkey, pk_, len1 ) &&
       0 < EVP_PKEY_get_raw_public_key( pkey, &pk_[pub_key::len], len2 );
  EVP_PKEY_free( pkey );
  return ok;
}

void key_pair::zero()
{
  __builtin_memset( pk_, 0, len );
}

bool key_pair::init_from_file( const std::string& file )
{
  mem_map mp;
  mp.set_file( file );
  if ( !mp.init() ) {
    return false;
  }
  return init_from_json( mp.data(), mp.size() );
}

bool key_pair::init_from_json( const std::string& buf )
{
  return init_from_json( buf.c_str(), buf.length() );
}

bool key_pair::init_from_json( const char *buf, size_t sz )
{
  jtree jt;
  jt.parse( buf, sz );
  if ( !jt.is_valid() || jt.get_type( 1 ) != jtree::e_arr ) {
    return false;
  }
  size_t i = 0;
  for( uint32_t it = jt.get_first(1); it; it = jt.get_next( it ) ) {
    if ( i == len ) {
      return false;
    }
    pk_[i++] = (uint8_t)jt.get_uint( it );
  }
  return i == len;
}

void key_pair::get_pub_key( pub_key& pk ) const
{
  pk.init_from_buf( &pk_[pub_key::len] );
}

void signature::init_from_buf( const uint8_t *buf )
{
  __builtin_memcpy( sig_, buf, len );
}

bool signature::init_from_text( const std::string& buf )
{
  uint8_t tmp[len];
  int n = cw::dec_base58(
      (const uint8_t*)buf.c_str(), buf.length(), tmp, len );
  if ( n <= 0 ) {
    return false;
  }
  __builtin_memset( sig_, 0, len );
  __builtin_memcpy( &sig_[len-n], tmp, n );
  return true;
}

int signature::enc_base58( uint8_t *buf, uint32_t buflen ) const
{
  return cw::enc_base58( sig_, len, buf, buflen );
}

int signature::enc_base58( std::string& res ) const
{
  uint8_t buf[128];
  int n = enc_base58( buf, sizeof( buf ) );
  res.assign( (const char*)buf, n );
  return n;
}

bool signature::sign(
    const uint8_t* msg, uint32_t msg_len, const key_pair& kp )
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_private_key( EVP_PKEY_ED25519,
      NULL, kp.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestSignInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc == 1 ) {
    size_t sig_len[1] = { len };
    rc = EVP_DigestSign( mctx, sig_, sig_len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}

bool signature::verify(
    const uint8_t* msg, uint32_t msg_len, const pub_key& pk ) const
{
  EVP_PKEY *pkey = EVP_PKEY_new_raw_public_key( EVP_PKEY_ED25519,
      NULL, pk.data(), pub_key::len );
  if ( !pkey ) {
    return false;
  }
  EVP_MD_CTX *mctx = EVP_MD_CTX_new();
  int rc = EVP_DigestVerifyInit( mctx, NULL, NULL, NULL, pkey );
  if ( rc == 1 ) {
    rc = EVP_DigestVerify( mctx, sig_, len, msg, msg_len );
  }
  EVP_MD_CTX_free( mctx );
  EVP_PKEY_free( pkey );
  return rc == 1;
}
