#pragma once

#include <cw/error.hpp>
#include <cw/key_pair.hpp>
#include <vector>

namespace cw
{

  // snapshot of an on-chain account
  struct account_info
  {
    account_info();
    bool     exists_;
    uint64_t lamports_;
    pub_key  owner_;
    std::vector<uint8_t> data_;
  };

  // view of the cluster used by the upload driver.
  // all calls block; failures set the error kind (transient or protocol)
  // and the on-chain program error code where one was returned
  class ledger : public error
  {
  public:
    virtual ~ledger();

    // block hash to embed in the next transaction
    virtual bool get_block_hash( hash& ) = 0;

    // minimum balance for a rent-exempt account of data_len bytes
    virtual bool get_rent_exempt( uint64_t data_len, uint64_t& lamports ) = 0;

    // current account state (exists_ false if there is no such account)
    virtual bool get_account( const pub_key&, account_info& ) = 0;

    // submit serialized transaction and wait for it to be confirmed.
    // returns true only once the transaction has executed successfully
    virtual bool send_transaction( const char *buf, size_t len ) = 0;
  };

  inline account_info::account_info()
  : exists_( false ),
    lamports_( 0 )
  {
  }

  inline ledger::~ledger()
  {
  }

}
