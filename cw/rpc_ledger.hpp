#pragma once

#include <cw/ledger.hpp>
#include <cw/rpc_client.hpp>

namespace cw
{

  // ledger backed by a solana json-rpc node over http
  class rpc_ledger : public ledger
  {
  public:

    rpc_ledger();

    // rpc host (host[:port], default localhost:8899)
    void set_rpc_host( const std::string& );
    std::string get_rpc_host() const;

    // commitment required for reads and confirmation
    void set_commitment( commitment );
    commitment get_commitment() const;

    // max time to wait for any single rpc reply
    void set_rpc_timeout( int64_t nsecs );
    int64_t get_rpc_timeout() const;

    // max time to wait for a submitted transaction to reach commitment
    void set_confirm_timeout( int64_t nsecs );
    int64_t get_confirm_timeout() const;

    // interval between signature status polls
    void set_poll_interval( int64_t nsecs );

    // connect to rpc node
    bool init();

    bool get_block_hash( hash& ) override;
    bool get_rent_exempt( uint64_t data_len, uint64_t& lamports ) override;
    bool get_account( const pub_key&, account_info& ) override;
    bool send_transaction( const char *buf, size_t len ) override;

  private:

    // send request and poll connection until reply or timeout
    bool call( rpc_request * );
    bool reconnect();

    std::string  rhost_;
    commitment   cmt_;
    int64_t      rpc_timeout_;
    int64_t      cnf_timeout_;
    int64_t      poll_intv_;
    net_loop     nl_;
    tcp_connect  hconn_;
    rpc_client   clnt_;
  };

}
