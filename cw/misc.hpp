#pragma once

#include <stdint.h>
#include <string>

#define CW_UNLIKELY(ARG) __builtin_expect((ARG),0)
#define CW_NSECS_IN_SEC  1000000000L
#define CW_NSECS_IN_MSEC 1000000L

namespace cw
{

  // base58 encoding as used for solana keys and signatures
  // returns number of characters written or 0 if rlen is too short
  int enc_base58( const uint8_t *src, int len, uint8_t *result, int rlen );

  // returns number of bytes decoded into result or -1 on invalid input
  // or if more than rlen bytes would be required
  int dec_base58( const uint8_t *str, int len, uint8_t *result, int rlen );

  // base64 encoding of binary transactions and account data
  int enc_base64_len( int len );
  int enc_base64( const uint8_t *src, int len, uint8_t *result );
  int dec_base64( const uint8_t *str, int len, uint8_t *result );

  // integer to string encoding
  char *uint_to_str( uint64_t val, char *end_ptr );
  uint64_t str_to_uint( const char *str, int len );
  char *int_to_str( int64_t val, char *end_ptr );
  int64_t str_to_int( const char *str, int len );

  // current time
  int64_t get_now();
  char *nsecs_to_utc6( int64_t ts, char *cptr );
  void sleep_nsecs( int64_t nsecs );

  // split host[:port] into host and port (port left unchanged if absent)
  std::string get_host_port( const std::string& host, int& port );

  // string as char pointer plus length
  struct str
  {
    str( const char * );
    str( const char *, size_t );
    str( const uint8_t *, size_t );
    str( const std::string& );
    bool operator==( const str& ) const;
    std::string as_string() const;
    const char *str_;
    size_t      len_;
  };

  /////////////////////////////////////////////////////////////////////////
  // inline impl

  inline str::str( const char *str )
  : str_( str ), len_( __builtin_strlen( str ) ) {
  }

  inline str::str( const char *str, size_t len )
  : str_( str ), len_( len ) {
  }

  inline str::str( const uint8_t *str, size_t len )
  : str_( (const char*)str ), len_( len ) {
  }

  inline str::str( const std::string& str )
  : str_( str.c_str() ), len_( str.length() ) {
  }

  inline bool str::operator==( const str& obj ) const
  {
    return len_ == obj.len_ &&
           0 == __builtin_strncmp( str_, obj.str_, len_);
  }

  inline std::string str::as_string() const
  {
    return std::string( str_, len_ );
  }

}
