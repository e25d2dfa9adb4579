#pragma once

#include "../write_account/util/compat_stdint.h"

#ifdef __cplusplus
extern "C" {
#endif

// checksum of instruction [mult, data...] over 2-byte pairs as
// sum( pair[0]*mult + pair[1] ) with wrapping addition. a trailing odd
// byte counts as a pair with a zero second byte
static inline bool chsum_compute( const uint8_t *ix, uint64_t ix_len,
                                  uint64_t *res )
{
  if ( ix_len == 0 ) {
    return false;
  }
  uint64_t mult = ix[0];
  uint64_t sum  = 0;
  for( uint64_t i = 1; i < ix_len; i += 2 ) {
    uint64_t lo = i + 1 < ix_len ? ix[i+1] : 0;
    sum += (uint64_t)ix[i] * mult + lo;
  }
  *res = sum;
  return true;
}

#ifdef __cplusplus
}
#endif
