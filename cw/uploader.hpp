#pragma once

#include <cw/chunk_plan.hpp>
#include <cw/ledger.hpp>
#include <atomic>
#include <vector>

namespace cw
{

  // ledger view of a chunk account
  enum upload_state
  {
    e_upload_uninitialized = 0,
    e_upload_writing,
    e_upload_complete,
    e_upload_closed
  };

  const char *upload_state_name( upload_state );

  // stop an upload between chunks. cancel() may be called from another
  // thread, the deadline is an absolute get_now() timestamp
  class cancel_token
  {
  public:
    cancel_token();

    void cancel();
    void set_deadline( int64_t ts );
    int64_t get_deadline() const;
    bool get_is_cancelled() const;

  private:
    typedef std::atomic<bool> atomic_t;
    atomic_t flag_;
    int64_t  deadline_;
  };

  // one payload destined for one chunk account
  class upload
  {
  public:
    upload();

    // payload bytes (copied)
    void set_payload( const uint8_t *buf, size_t len );
    void set_payload( const std::vector<uint8_t>& );
    const std::vector<uint8_t>& get_payload() const;

    // program allowed to consume the payload
    void set_target( const pub_key& );
    const pub_key& get_target() const;

    // chunk account key pair. begin_upload generates a fresh one unless
    // the caller has assigned one (e.g. after saving it to a key store)
    void set_chunk_key_pair( const key_pair& );
    const key_pair& get_chunk_key_pair() const;
    const pub_key& get_chunk_account() const;
    bool get_has_key() const;

    // account was created at some point (e.g. by an earlier process).
    // a missing account then reads as closed and is never recreated
    void set_is_created( bool );
    bool get_is_created() const;

    // last state observed by the driver
    upload_state get_state() const;
    uint64_t get_written() const;
    uint64_t get_total_len() const;

  private:
    friend class uploader;
    std::vector<uint8_t> buf_;
    pub_key      target_;
    key_pair     ckey_;
    pub_key      cpub_;
    bool         has_key_;
    bool         created_;
    upload_state st_;
    uint64_t     written_;
    uint64_t     total_len_;
  };

  // drives chunk accounts through initialize, ordered writes and close.
  // all calls block until the account is complete or a terminal error
  class uploader : public error
  {
  public:

    uploader();

    // cluster access
    void set_ledger( ledger * );
    ledger *get_ledger() const;

    // writer and fee payer key
    void set_writer( const key_pair * );

    // write-account program id
    void set_program_id( const pub_key& );
    const pub_key& get_program_id() const;

    // transaction size limit and optional chunk cap
    bool set_tx_limit( size_t );
    void set_max_chunk( size_t );

    // retries of transient failures without progress (default 5)
    void set_max_retries( unsigned );
    unsigned get_max_retries() const;

    // delay between retries (default 500ms)
    void set_retry_delay( int64_t nsecs );

    // optional cancellation
    void set_cancel_token( const cancel_token * );

    // create and initialize a new chunk account and write payload
    bool begin_upload( upload& );

    // continue from the on-chain high-water mark
    bool resume( upload& );

    // read current state from ledger
    bool status( upload& );

    // release chunk account and refund lamports to writer
    bool close( upload& );

    // transactions submitted by the last operation
    uint64_t get_num_sent() const;
    uint64_t get_num_writes() const;

  private:

    bool check_config();
    bool run( upload&, bool read_first );
    bool read_account( upload&, bool& exists, bool is_match );
    bool send_create( upload& );
    bool send_write( upload&, const chunk_plan& );
    bool send_close( upload& );
    bool submit( bincode&, int prog_ix );
    bool on_failure( unsigned& nretry );
    bool is_cancelled();

    ledger             *lgr_;
    const key_pair     *wkey_;
    pub_key             wpub_;
    pub_key             gpub_;
    const cancel_token *ctok_;
    size_t              limit_;
    size_t              max_chunk_;
    unsigned            max_retries_;
    int64_t             retry_delay_;
    uint64_t            num_sent_;
    uint64_t            num_writes_;
  };

  inline const std::vector<uint8_t>& upload::get_payload() const
  {
    return buf_;
  }

  inline const pub_key& upload::get_target() const
  {
    return target_;
  }

  inline const key_pair& upload::get_chunk_key_pair() const
  {
    return ckey_;
  }

  inline const pub_key& upload::get_chunk_account() const
  {
    return cpub_;
  }

  inline bool upload::get_has_key() const
  {
    return has_key_;
  }

  inline void upload::set_is_created( bool created )
  {
    created_ = created;
  }

  inline bool upload::get_is_created() const
  {
    return created_;
  }

  inline upload_state upload::get_state() const
  {
    return st_;
  }

  inline uint64_t upload::get_written() const
  {
    return written_;
  }

  inline uint64_t upload::get_total_len() const
  {
    return total_len_;
  }

}
