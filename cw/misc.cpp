#include "misc.hpp"
#include <ctype.h>
#include <time.h>
#include <vector>

namespace cw
{

static const char b58_alphabet[] =
  "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

static int b58_lookup( uint8_t c )
{
  if ( c >= '1' && c <= '9' ) return c - '1';
  if ( c >= 'A' && c <= 'H' ) return c - 'A' + 9;
  if ( c >= 'J' && c <= 'N' ) return c - 'J' + 17;
  if ( c >= 'P' && c <= 'Z' ) return c - 'P' + 22;
  if ( c >= 'a' && c <= 'k' ) return c - 'a' + 33;
  if ( c >= 'm' && c <= 'z' ) return c - 'm' + 44;
  return -1;
}

int enc_base58( const uint8_t *src, int len, uint8_t *result, int rlen )
{
  int zeros = 0;
  while( zeros < len && src[zeros] == 0 ) ++zeros;

  // log(256)/log(58) ~ 1.37 digits per byte
  std::vector<uint8_t> b58( (len - zeros) * 138 / 100 + 1, 0 );
  int size = (int)b58.size(), used = 0;
  for( int i = zeros; i < len; ++i ) {
    uint32_t carry = src[i];
    int j = 0;
    for( int k = size - 1; (carry || j < used) && k >= 0; --k, ++j ) {
      carry += 256U * b58[k];
      b58[k] = carry % 58;
      carry /= 58;
    }
    used = j;
  }
  int it = size - used;
  while( it < size && b58[it] == 0 ) ++it;
  int total = zeros + size - it;
  if ( total >= rlen ) {
    return 0;
  }
  int ri = 0;
  for( ; ri < zeros; ++ri ) result[ri] = '1';
  for( ; it < size; ++it ) result[ri++] = b58_alphabet[b58[it]];
  result[ri] = 0;
  return ri;
}

int dec_base58( const uint8_t *str, int len, uint8_t *result, int rlen )
{
  int zeros = 0;
  while( zeros < len && str[zeros] == '1' ) ++zeros;

  // log(58)/log(256) ~ 0.733 bytes per digit
  std::vector<uint8_t> b256( (len - zeros) * 733 / 1000 + 1, 0 );
  int size = (int)b256.size();
  for( int i = zeros; i < len; ++i ) {
    int val = b58_lookup( str[i] );
    if ( val < 0 ) {
      return -1;
    }
    uint32_t carry = (uint32_t)val;
    for( int k = size - 1; k >= 0; --k ) {
      carry += 58U * b256[k];
      b256[k] = carry & 0xff;
      carry >>= 8;
    }
    if ( carry ) {
      return -1;
    }
  }
  int it = 0;
  while( it < size && b256[it] == 0 ) ++it;
  int total = zeros + size - it;
  if ( total > rlen ) {
    return -1;
  }
  int ri = 0;
  for( ; ri < zeros; ++ri ) result[ri] = 0;
  for( ; it < size; ++it ) result[ri++] = b256[it];
  return ri;
}

char *uint_to_str( uint64_t val, char *cptr )
{
  if ( val ) {
    while( val ) {
      *--cptr = '0' + (val%10L);
      val /= 10L;
    }
  } else {
    *--cptr = '0';
  }
  return cptr;
}

uint64_t str_to_uint( const char *val, int len )
{
  uint64_t res = 0L;
  const char *end = &val[len];
  for( const char *cptr = val; cptr != end; ++cptr ) {
    if ( !isdigit( (unsigned char)*cptr ) ) {
      return 0L;
    }
    res = res*10UL + (*cptr-'0');
  }
  return res;
}

char *int_to_str( int64_t val, char *cptr )
{
  uint64_t uval = val < 0 ? -(uint64_t)val : (uint64_t)val;
  cptr = uint_to_str( uval, cptr );
  if ( val < 0 ) {
    *--cptr = '-';
  }
  return cptr;
}

int64_t str_to_int( const char *val, int len )
{
  if ( len > 0 && val[0] == '-' ) {
    return -(int64_t)str_to_uint( &val[1], len - 1 );
  }
  return (int64_t)str_to_uint( val, len );
}

//////////////////////////////////////////////////////////////////
// base64 encode/decode

static const char b64_alphabet[] =
  "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
  "abcdefghijklmnopqrstuvwxyz"
  "0123456789+/";

static int b64_lookup( uint8_t c )
{
  if ( c >= 'A' && c <= 'Z' ) return c - 'A';
  if ( c >= 'a' && c <= 'z' ) return c - 'a' + 26;
  if ( c >= '0' && c <= '9' ) return c - '0' + 52;
  if ( c == '+' ) return 62;
  if ( c == '/' ) return 63;
  return -1;
}

int enc_base64_len( int n )
{
  return (n + 2) / 3 * 4;
}

int enc_base64( const uint8_t *inp, int len, uint8_t *out )
{
  int olen = 0;
  for( ; len >= 3; len -= 3, inp += 3 ) {
    uint32_t v = (inp[0]<<16) | (inp[1]<<8) | inp[2];
    out[olen++] = b64_alphabet[(v>>18)&0x3f];
    out[olen++] = b64_alphabet[(v>>12)&0x3f];
    out[olen++] = b64_alphabet[(v>>6)&0x3f];
    out[olen++] = b64_alphabet[v&0x3f];
  }
  if ( len ) {
    uint32_t v = inp[0]<<16;
    if ( len == 2 ) v |= inp[1]<<8;
    out[olen++] = b64_alphabet[(v>>18)&0x3f];
    out[olen++] = b64_alphabet[(v>>12)&0x3f];
    out[olen++] = len == 2 ? b64_alphabet[(v>>6)&0x3f] : '=';
    out[olen++] = '=';
  }
  return olen;
}

int dec_base64( const uint8_t *inp, int len, uint8_t *out )
{
  uint32_t acc = 0;
  int bits = 0, olen = 0;
  for( int i = 0; i != len && inp[i] != '='; ++i ) {
    int v = b64_lookup( inp[i] );
    if ( v < 0 ) {
      return -1;
    }
    acc = (acc<<6) | (uint32_t)v;
    bits += 6;
    if ( bits >= 8 ) {
      bits -= 8;
      out[olen++] = (uint8_t)((acc>>bits)&0xff);
    }
  }
  return olen;
}

int64_t get_now()
{
  struct timespec ts[1];
  clock_gettime( CLOCK_REALTIME, ts );
  int64_t res = ts->tv_sec;
  res *= CW_NSECS_IN_SEC;
  res += ts->tv_nsec;
  return res;
}

void sleep_nsecs( int64_t nsecs )
{
  if ( nsecs <= 0 ) {
    return;
  }
  struct timespec ts[1];
  ts->tv_sec  = nsecs / CW_NSECS_IN_SEC;
  ts->tv_nsec = nsecs % CW_NSECS_IN_SEC;
  clock_nanosleep( CLOCK_MONOTONIC, 0, ts, NULL );
}

static void uint_to_strn( char *cptr, int64_t val, int n )
{
  for( int i = n - 1; i >= 0; --i ) {
    cptr[i] = '0' + (val%10L);
    val /= 10L;
  }
}

char *nsecs_to_utc6( int64_t ts, char *cptr )
{
  int64_t nsecs = ts%CW_NSECS_IN_SEC;
  time_t secs = ts/CW_NSECS_IN_SEC;
  struct tm t[1];
  gmtime_r( &secs, t );
  uint_to_strn( &cptr[0], t->tm_year + 1900, 4 );
  uint_to_strn( &cptr[5], t->tm_mon + 1, 2 );
  uint_to_strn( &cptr[8], t->tm_mday, 2 );
  uint_to_strn( &cptr[11], t->tm_hour, 2 );
  uint_to_strn( &cptr[14], t->tm_min, 2 );
  uint_to_strn( &cptr[17], t->tm_sec, 2 );
  uint_to_strn( &cptr[20], nsecs/1000L, 6 );
  cptr[4] = cptr[7] = '-';
  cptr[10] = 'T';
  cptr[13] = cptr[16] = ':';
  cptr[19] = '.';
  cptr[26] = 'Z';
  cptr[27] = '\0';
  return cptr;
}

std::string get_host_port( const std::string& host, int& port )
{
  size_t pos = host.find( ':' );
  if ( pos == std::string::npos ) {
    return host;
  }
  std::string pstr = host.substr( pos + 1 );
  port = (int)str_to_uint( pstr.c_str(), (int)pstr.length() );
  return host.substr( 0, pos );
}

}
