#pragma once

#include <cw/error.hpp>
#include <cw/key_pair.hpp>
#include <cw/misc.hpp>
#include <sys/epoll.h>
#include <vector>

namespace cw
{

  // message writer appending into one contiguous buffer
  class net_wtr
  {
  public:
    net_wtr();
    void add( char );
    void add( str );
    void add( net_wtr& );
    void detach( std::string& );
    size_t size() const;
    void copy( std::string& ) const;
    void reset();

  protected:
    // reserve len bytes at the end then keep the first len bytes used
    char *reserve( size_t len );
    void advance( size_t len );
    std::string buf_;
    size_t      rsv_;

  private:
    net_wtr( const net_wtr& ) = delete;
    net_wtr& operator=( const net_wtr& ) = delete;
  };

  // parse inbound fragmented messages from streaming protocols
  class net_parser : public error
  {
  public:
    virtual ~net_parser();

    // parse inbound message
    virtual bool parse( const char *buf, size_t sz, size_t& len ) = 0;
  };

  class tcp_connect;

  // epoll-based loop
  class net_loop : public error
  {
  public:
    net_loop();
    ~net_loop();

    // initialize
    bool init();

    // add/delete connections to epoll loop
    void add( tcp_connect *, bool is_send );
    void del( tcp_connect * );

    // poll all connections (timeout in millisecs)
    bool poll( int timeout );

  private:

    static const int max_events_ = 16;

    int         fd_;                 // epoll file descriptor
    epoll_event evarr_[max_events_]; // receive events
  };

  // non-blocking tcp client connection with a send queue and an
  // inbound message parser
  class tcp_connect : public error
  {
  public:

    tcp_connect();
    ~tcp_connect();

    // connection host
    void set_host( const std::string& );
    std::string get_host() const;

    // connection port
    void set_port( int port );
    int get_port() const;

    // give up on connecting after nsecs (default 10s)
    void set_connect_timeout( int64_t nsecs );
    int64_t get_connect_timeout() const;

    // associated epoll loop
    void set_net_loop( net_loop * );

    // associated parser
    void set_net_parser( net_parser * );

    // (re)connect to host
    bool init();

    // file descriptor or -1 if not connected
    int get_fd() const;

    // flag indicating if part of net_loop
    void set_in_loop( bool );
    bool get_in_loop() const;

    // add message to send queue
    void add_send( net_wtr& );

    // any bytes in the send queue
    bool get_is_send() const;

    // send/receive polling
    void poll();
    void poll_send();
    void poll_recv();

    // close socket and drop queued and buffered bytes
    void teardown();

  private:

    static const size_t buf_len = 2048;

    void poll_error( bool is_read, int ec );

    int         fd_;   // socket
    int         port_; // connection port
    bool        inl_;  // in-loop flag
    int64_t     cto_;  // connect timeout
    std::string host_; // connection host
    net_loop   *lp_;   // optional event loop
    net_parser *np_;   // message parser
    std::string sbuf_; // bytes queued for sending
    size_t      soff_; // bytes of sbuf_ already sent
    std::vector<char> rdr_; // inbound read buffer
    size_t      rsz_;  // bytes buffered in rdr_
  };

  // http request message
  class http_request : public net_wtr
  {
  public:
    void init( const char *method="POST", const char *endpoint="/" );
    void add_hdr( const char *hdr, str );
    void add_hdr( const char *hdr, uint64_t val );
    void commit( net_wtr& );
  };

  // http client parser
  class http_client : public net_parser
  {
  public:
    bool parse( const char *buf, size_t sz, size_t& len ) override;
    virtual void parse_status( int, const char *, size_t);
    virtual void parse_content( const char *content, size_t content_len );
  };

  // json message builder
  class json_wtr : public net_wtr
  {
  public:

    typedef enum { e_obj = 0, e_arr } type_t;

    json_wtr();
    void reset();

    // pop latest object/array
    void pop();

    // add key/value pair in object
    void add_key( str key, str val );
    void add_key( str key, uint64_t val );
    void add_key( str key, type_t );

    // add array value
    void add_val( str val );
    void add_val( uint64_t );
    void add_val( type_t );
    void add_val( const key_pair& );
    void add_val( const hash& );
    void add_val( const signature& );
    void add_val_enc_base58( str val );
    void add_val_enc_base64( str val );

  private:

    typedef std::vector<type_t> type_vec_t;

    void open( type_t );
    void add_sep();
    void add_uint( uint64_t ival );
    void add_text( str );

    bool       first_;
    type_vec_t st_;
  };

}
