#pragma once

#include <cw/key_pair.hpp>
#include <stdint.h>

namespace cw
{

  // little-endian binary serialization of solana wire messages in the
  // spirit of rust bincode convention
  class bincode
  {
  public:
    bincode();
    bincode( char* );

    // attach buffer
    void attach( char *buf );
    char *get_buf() const;
    size_t size() const;

    // get/modify current write position
    size_t get_pos() const;
    void reset_pos();

    // reserve slot for signature
    size_t reserve_sign();

    // sign message at position sig for message starting at position msg
    bool sign( size_t sig, size_t msg, const key_pair& );

    // add values to buffer
    void add( uint8_t );
    void add( uint32_t );
    void add( uint64_t );
    void add( const hash& );
    void add( const uint8_t *, size_t );

    // compact-u16 length encoding
    template<unsigned N> void add_len();
    void add_len( unsigned );

    // bytes required to encode length
    static size_t len_size( unsigned );

  private:
    template<class T> void add_val_T( T val );
    char  *buf_;
    size_t idx_;
  };

  inline bincode::bincode()
  : buf_( nullptr ), idx_( 0 ) {
  }

  inline bincode::bincode( char *buf )
  : buf_( buf ), idx_( 0 ) {
  }

  inline void bincode::attach( char *buf )
  {
    buf_ = buf;
    idx_ = 0;
  }

  inline char *bincode::get_buf() const
  {
    return buf_;
  }

  inline size_t bincode::size() const
  {
    return idx_;
  }

  inline void bincode::reset_pos()
  {
    idx_ = 0;
  }

  inline size_t bincode::get_pos() const
  {
    return idx_;
  }

  inline void bincode::add( uint8_t val )
  {
    buf_[idx_++] = val;
  }

  template<class T>
  void bincode::add_val_T( T val )
  {
    __builtin_memcpy( &buf_[idx_], &val, sizeof( T ) );
    idx_ += sizeof( T );
  }

  inline void bincode::add( uint32_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( uint64_t val )
  {
    add_val_T( val );
  }

  inline void bincode::add( const hash& pk )
  {
    __builtin_memcpy( &buf_[idx_], pk.data(), hash::len );
    idx_ += hash::len;
  }

  inline void bincode::add( const uint8_t *buf, size_t len )
  {
    __builtin_memcpy( &buf_[idx_], buf, len );
    idx_ += len;
  }

  template<unsigned N> void bincode::add_len()
  {
    static_assert( N < 0x10000 );
    add_len( N );
  }

  inline void bincode::add_len( unsigned N )
  {
    while( N >= 0x80 ) {
      buf_[idx_++] = (char)(0x80 | (N&0x7f) );
      N >>= 7;
    }
    buf_[idx_++] = (char)N;
  }

  inline size_t bincode::len_size( unsigned N )
  {
    return N < 0x80 ? 1 : ( N < 0x4000 ? 2 : 3 );
  }

  inline size_t bincode::reserve_sign()
  {
    size_t idx = idx_;
    idx_ += signature::len;
    return idx;
  }

  inline bool bincode::sign( size_t sig, size_t msg, const key_pair& kp )
  {
    signature sg;
    if ( !sg.sign( (const uint8_t*)&buf_[msg], idx_ - msg, kp ) ) {
      return false;
    }
    __builtin_memcpy( &buf_[sig], sg.data(), signature::len );
    return true;
  }

}
