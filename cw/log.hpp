#pragma once

#include <cw/net_socket.hpp>

#define CW_LOG_DBG_LVL (1U<<3)
#define CW_LOG_INF_LVL (1U<<2)
#define CW_LOG_WRN_LVL (1U<<1)
#define CW_LOG_ERR_LVL (1U<<0)

#define CW_LOG_TXT(X,LVL) \
if (cw::log::has_level(LVL)) cw::log::add(X,LVL)
#define CW_LOG_DBG(X) CW_LOG_TXT(X,CW_LOG_DBG_LVL)
#define CW_LOG_INF(X) CW_LOG_TXT(X,CW_LOG_INF_LVL)
#define CW_LOG_WRN(X) CW_LOG_TXT(X,CW_LOG_WRN_LVL)
#define CW_LOG_ERR(X) CW_LOG_TXT(X,CW_LOG_ERR_LVL)

namespace cw
{

  class log_wtr : public net_wtr
  {
  public:
    void add_i64( int64_t );
    void add_u64( uint64_t );
  };

  // log line of comma separated key=value pairs
  class log_line
  {
  public:
    log_line& add( str key, str val );
    log_line& add( str key, const hash& val );
    log_line& add( str key, const signature& val );
    log_line& add( str key, const error& val );
    log_line& add( str key, int32_t );
    log_line& add( str key, int64_t );
    log_line& add( str key, uint64_t );
    log_line& add( str key, uint32_t );
    void end();
    friend class log;
  private:
    log_line( str, int lvl );
    void add_key( str );
    bool    is_first_;
    log_wtr wtr_;
  };

  // log reporting to stderr from a background thread
  class log
  {
  public:

    static void set_level( int level );
    static bool has_level( int level );
    static log_line add( str topic, int level );
  private:
    static int level_;
  };

  inline bool log::has_level( int level )
  {
    return level&level_;
  }

}
