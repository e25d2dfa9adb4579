#pragma once

#include <cw/ledger.hpp>
#include <map>
#include <set>
#include <mutex>

namespace cw
{

  // in-memory cluster for tests. transactions are decoded from the wire
  // format, every signature is verified and the system CreateAccount and
  // write-account instructions are applied atomically per transaction.
  // faults are injected by submission index (0-based, counting every
  // call to send_transaction)
  class sim_ledger : public ledger
  {
  public:

    sim_ledger();

    // write-account program id
    void set_program_id( const pub_key& );

    // credit system account
    void fund( const pub_key&, uint64_t lamports );

    // submission idx fails transiently without executing
    void drop_at( uint64_t idx );

    // submission idx executes but its confirmation is lost
    void lose_at( uint64_t idx );

    // every submission from idx on fails transiently
    void set_fail_from( uint64_t idx );

    // next num get_account calls fail transiently
    void fail_reads( unsigned num );

    // remove all pending faults
    void clear_faults();

    // all previously issued block hashes become unknown
    void expire_block_hashes();

    // statistics
    uint64_t get_num_submitted() const;
    uint64_t get_num_executed() const;
    uint64_t get_num_writes() const;

    // account lookup for assertions (nullptr if none)
    const account_info *find_account( const pub_key& ) const;
    uint64_t get_balance( const pub_key& ) const;

    bool get_block_hash( hash& ) override;
    bool get_rent_exempt( uint64_t data_len, uint64_t& lamports ) override;
    bool get_account( const pub_key&, account_info& ) override;
    bool send_transaction( const char *buf, size_t len ) override;

  private:

    typedef std::map<pub_key, account_info> acc_map_t;
    typedef std::set<hash>                  hash_set_t;
    typedef std::set<std::string>           sig_set_t;
    typedef std::set<uint64_t>              idx_set_t;

    // decode, verify and apply transaction to copies of the accounts it
    // references
    bool execute( const uint8_t *buf, size_t len,
                  acc_map_t& accs, std::string& sig );
    bool create_account( acc_map_t&, const pub_key& from,
                         const pub_key& to, bool is_signed,
                         const uint8_t *data, size_t data_len );
    bool write_account( acc_map_t&, const pub_key& writer,
                        const pub_key& acc, bool is_signed,
                        const uint8_t *data, size_t data_len );

    mutable std::mutex mtx_;
    pub_key    gpub_;
    acc_map_t  accs_;
    hash_set_t bhash_;
    sig_set_t  sigs_;
    idx_set_t  drops_;
    idx_set_t  loses_;
    uint64_t   fail_from_;
    unsigned   fail_reads_;
    uint64_t   slot_;
    uint64_t   num_sub_;
    uint64_t   num_exec_;
    uint64_t   num_writes_;
    uint64_t   ix_writes_;
  };

}
