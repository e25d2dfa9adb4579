#include "chunk_plan.hpp"

using namespace cw;

chunk_plan::chunk_plan()
: buf_( nullptr ),
  len_( 0 ),
  limit_( CW_TX_MAX_SIZE ),
  max_( CW_TX_MAX_SIZE )
{
}

void chunk_plan::set_payload( const uint8_t *buf, size_t len )
{
  buf_ = buf;
  len_ = len;
}

bool chunk_plan::set_tx_limit( size_t limit )
{
  if ( limit <= CW_TX_WRITE_OVERHEAD ) {
    return set_err( e_err_invalid, 0,
        "transaction size limit leaves no room for payload" );
  }
  if ( limit > CW_TX_MAX_SIZE ) {
    return set_err( e_err_invalid, 0,
        "transaction size limit exceeds cluster maximum" );
  }
  limit_ = limit;
  return true;
}

void chunk_plan::set_max_chunk( size_t max_chunk )
{
  max_ = max_chunk ? max_chunk : 1;
}

size_t chunk_plan::get_chunk_size() const
{
  size_t csz = limit_ - CW_TX_WRITE_OVERHEAD;
  return max_ < csz ? max_ : csz;
}

size_t chunk_plan::get_num_chunks() const
{
  size_t csz = get_chunk_size();
  return ( len_ + csz - 1 ) / csz;
}

bool chunk_plan::first( chunk& c, uint64_t from ) const
{
  if ( from >= len_ ) {
    return false;
  }
  uint64_t csz = get_chunk_size();
  uint64_t end = ( from / csz + 1 ) * csz;
  if ( end > len_ ) {
    end = len_;
  }
  c.off_ = from;
  c.buf_ = &buf_[from];
  c.len_ = end - from;
  return true;
}

bool chunk_plan::next( chunk& c ) const
{
  return first( c, c.off_ + c.len_ );
}
