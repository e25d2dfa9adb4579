#pragma once

#include <cw/bincode.hpp>
#include <cw/key_pair.hpp>

// largest serialized transaction accepted by the cluster
#define CW_TX_MAX_SIZE        1232

// serialized size of a single-signer write transaction carrying no
// payload with the data length encoded at its widest (two bytes)
#define CW_TX_WRITE_OVERHEAD  213

namespace cw
{

  // transaction message construction for the write-account protocol.
  // callers supply a buffer of at least CW_TX_MAX_SIZE bytes
  namespace tx
  {

    // system CreateAccount sized for header plus capacity bytes and
    // owned by the write-account program, followed by Initialize.
    // signed by writer (fee payer) and the new chunk account
    bool create_and_initialize( bincode&,
                                const hash& recent_hash,
                                const key_pair& writer,
                                const key_pair& chunk_acc,
                                uint64_t lamports,
                                uint64_t capacity,
                                uint64_t total_len,
                                const pub_key& target_id,
                                const pub_key& program_id );

    // append bytes at offset; fails if the transaction would exceed
    // CW_TX_MAX_SIZE
    bool write( bincode&,
                const hash& recent_hash,
                const key_pair& writer,
                const pub_key& chunk_acc,
                const pub_key& program_id,
                uint64_t offset,
                const uint8_t *buf,
                size_t len );

    // release chunk account and refund its lamports to writer
    bool close( bincode&,
                const hash& recent_hash,
                const key_pair& writer,
                const pub_key& chunk_acc,
                const pub_key& program_id );

    // call target program with the chunk account as its only account
    // and empty instruction data
    bool invoke_with_account( bincode&,
                              const hash& recent_hash,
                              const key_pair& payer,
                              const pub_key& target_id,
                              const pub_key& chunk_acc );

    // transaction id (first signature) of a built transaction
    void get_signature( const bincode&, signature& );

  }

}
