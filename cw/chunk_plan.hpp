#pragma once

#include <cw/error.hpp>
#include <cw/tx.hpp>

namespace cw
{

  // one planned write of payload bytes at offset
  struct chunk
  {
    uint64_t       off_;
    const uint8_t *buf_;
    size_t         len_;
  };

  // split a payload into transaction-sized writes.
  // chunk i covers [i*C, min((i+1)*C, len)) where C is the chunk size.
  // the plan is lazy and does not copy the payload
  class chunk_plan : public error
  {
  public:

    chunk_plan();

    // payload to split
    void set_payload( const uint8_t *buf, size_t len );
    const uint8_t *get_payload() const;
    size_t get_payload_len() const;

    // serialized transaction size limit (default CW_TX_MAX_SIZE).
    // limits that leave no room for payload or exceed CW_TX_MAX_SIZE
    // are rejected
    bool set_tx_limit( size_t limit );
    size_t get_tx_limit() const;

    // optional cap on the chunk size, clamped to [1, limit - overhead]
    void set_max_chunk( size_t );

    // effective chunk size C
    size_t get_chunk_size() const;

    // number of chunks of a plan starting at offset zero
    size_t get_num_chunks() const;

    // chunk starting at offset from, running to the next multiple of C.
    // returns false if from is at or past the end of the payload
    bool first( chunk&, uint64_t from = 0 ) const;

    // chunk following c
    bool next( chunk& c ) const;

  private:
    const uint8_t *buf_;
    size_t         len_;
    size_t         limit_;
    size_t         max_;
  };

  inline const uint8_t *chunk_plan::get_payload() const
  {
    return buf_;
  }

  inline size_t chunk_plan::get_payload_len() const
  {
    return len_;
  }

  inline size_t chunk_plan::get_tx_limit() const
  {
    return limit_;
  }

}
