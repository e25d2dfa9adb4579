#pragma once

#include <cw/net_socket.hpp>
#include <cw/jtree.hpp>
#include <cw/key_pair.hpp>

#include <unordered_map>
#include <vector>

#define CW_RPC_ERROR_BLOCK_CLEANED_UP          -32001
#define CW_RPC_ERROR_SEND_TX_PREFLIGHT_FAIL    -32002
#define CW_RPC_ERROR_TX_SIG_VERIFY_FAILURE     -32003
#define CW_RPC_ERROR_BLOCK_NOT_AVAILABLE       -32004
#define CW_RPC_ERROR_NODE_UNHEALTHY            -32005

namespace cw
{
  class rpc_request;

  // commitment status of account on blockchain
  enum commitment
  {
    e_unknown = 0,
    e_processed,
    e_confirmed,
    e_finalized,
    e_last_commitment
  };

  str commitment_to_str( commitment );
  commitment str_to_commitment( str );

  // solana rpc REST API client
  class rpc_client : public error
  {
  public:

    rpc_client();
    ~rpc_client();

    // rpc http connection
    void set_http_conn( tcp_connect * );
    tcp_connect *get_http_conn() const;

    // submit rpc request
    void send( rpc_request * );

    // parse json payload and dispatch to waiting request
    void parse_response( const char *msg, size_t msg_len );

    // decode base64+zstd account data
    bool decode_data( str data, std::vector<uint8_t>& res );

    // drop all outstanding requests (e.g. after reconnect)
    void reset();

  private:

    struct rpc_http : public http_client {
      void parse_content( const char *, size_t ) override;
      rpc_client *cp_;
    };

    typedef std::unordered_map< uint64_t, rpc_request* > request_t;
    typedef std::vector<char>         acc_buf_t;

    tcp_connect *hptr_;
    rpc_http     hp_;    // http parser wrapper
    jtree        jp_;    // json parser
    request_t    rv_;    // waiting requests by id
    acc_buf_t    abuf_;  // account decode buffer
    uint64_t     id_;    // next request id
    void        *cxt_;   // zstd decompression context
  };

  // base-class rpc request message
  class rpc_request : public error
  {
  public:
    rpc_request();
    virtual ~rpc_request();

    // corresponding rpc_client
    void set_rpc_client( rpc_client * );
    rpc_client *get_rpc_client() const;

    // request id
    void set_id( uint64_t );
    uint64_t get_id() const;

    // json-rpc error code
    void set_rpc_code( int );
    int get_rpc_code() const;

    // time sent
    void set_sent_time( int64_t );
    int64_t get_sent_time() const;

    // time received reply
    void set_recv_time( int64_t );
    int64_t get_recv_time() const;

    // have we received a reply
    bool get_is_recv() const;

    // request builder
    virtual void request( json_wtr& ) = 0;

    // response parsing
    virtual void response( const jtree& ) = 0;

  protected:

    bool on_error( const jtree& );
    void on_response();

  private:
    rpc_client *cp_;
    uint64_t    id_;
    int         ec_;
    int64_t     sent_ts_;
    int64_t     recv_ts_;
  };

  // decode a transaction error object such as
  // {"InstructionError":[1,{"Custom":5}]} into err.
  // custom program codes become protocol errors, anything that may
  // succeed on resubmission (e.g. BlockhashNotFound) is transient
  void decode_tx_err( const jtree&, uint32_t etok, error& err );

  /////////////////////////////////////////////////////////////////////////
  // wrappers for various solana rpc requests

  namespace rpc
  {
    // latest block hash for transaction submission
    class get_latest_block_hash : public rpc_request
    {
    public:
      get_latest_block_hash();

      // parameters
      void set_commitment( commitment );

      // results
      uint64_t get_slot() const;
      const hash& get_block_hash() const;
      uint64_t get_last_valid_height() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      commitment cmt_;
      uint64_t   slot_;
      hash       bhash_;
      uint64_t   height_;
    };

    // lamports needed for an account of given size to be rent exempt
    class get_minimum_balance_rent_exemption : public rpc_request
    {
    public:
      get_minimum_balance_rent_exemption();

      // parameters
      void set_size( size_t );

      // results
      uint64_t get_lamports() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      size_t   sz_;
      uint64_t lamports_;
    };

    // get account balance, program data and owner
    class get_account_info : public rpc_request
    {
    public:
      get_account_info();

      // parameters
      void set_account( const pub_key& );
      void set_commitment( commitment );

      // results
      bool     get_is_exists() const;
      uint64_t get_slot() const;
      uint64_t get_lamports() const;
      const pub_key& get_owner() const;
      const std::vector<uint8_t>& get_data() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      pub_key    acc_;
      commitment cmt_;
      bool       exists_;
      uint64_t   slot_;
      uint64_t   lamports_;
      pub_key    owner_;
      std::vector<uint8_t> data_;
    };

    // submit signed transaction
    class send_transaction : public rpc_request
    {
    public:
      send_transaction();

      // parameters
      void set_transaction( const char *buf, size_t len );
      void set_commitment( commitment );

      // results
      const signature& get_signature() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      std::string tx_;
      commitment  cmt_;
      signature   sig_;
    };

    // processing status of a submitted transaction
    class get_signature_statuses : public rpc_request
    {
    public:
      get_signature_statuses();

      // parameters
      void set_signature( const signature& );

      // results
      bool get_is_found() const;
      commitment get_status() const;
      bool get_is_tx_err() const;
      const error& get_tx_err() const;

      void request( json_wtr& ) override;
      void response( const jtree& ) override;

    private:
      signature  sig_;
      bool       found_;
      commitment st_;
      error      txerr_;
    };

  }

}
