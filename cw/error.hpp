#pragma once

#include <string>
#include <string.h>
#include <stdint.h>

// error code of an instruction failure raised by the runtime rather than
// a program's custom error (e.g. IncorrectProgramId)
#define CW_BUILTIN_ERR_CODE UINT64_MAX

namespace cw
{

  // classification of a failure for retry decisions
  enum err_kind_t
  {
    e_err_none = 0,
    e_err_protocol,     // deterministic rejection by write-account program
    e_err_transient,    // network, timeout, dropped or expired transaction
    e_err_integrity,    // chunk account failed trusted read checks
    e_err_cancelled,    // operation stopped by caller
    e_err_invalid       // bad local arguments or configuration
  };

  // name of write-account program error code (cw_err_t)
  const char *err_code_name( uint64_t code );

  // name of error kind
  const char *err_kind_name( err_kind_t );

  // container for general errors
  class error
  {
  public:
    error();
    void reset_err();
    bool get_is_err() const;
    bool set_err_msg( const std::string& );
    bool set_err_msg( const std::string&, int errcode );
    bool set_err( err_kind_t, uint64_t code, const std::string& );
    bool set_err( const error& );
    std::string get_err_msg() const;
    err_kind_t get_err_kind() const;
    uint64_t get_err_code() const;

    // index of the failed instruction within a rejected transaction
    // or -1 if the failure did not come from an instruction
    void set_err_ix( int );
    int get_err_ix() const;
  private:
    bool        is_err_;
    err_kind_t  err_kind_;
    uint64_t    err_code_;
    int         err_ix_;
    std::string err_msg_;
  };

  inline error::error()
  : is_err_( false ),
    err_kind_( e_err_none ),
    err_code_( 0 ),
    err_ix_( -1 )
  {
  }

  inline void error::reset_err()
  {
    is_err_ = false;
    err_kind_ = e_err_none;
    err_code_ = 0;
    err_ix_ = -1;
    err_msg_.clear();
  }

  inline bool error::get_is_err() const
  {
    return is_err_;
  }

  // untyped errors come from local io or parsing and are treated as
  // invalid unless a caller reclassifies them
  inline bool error::set_err_msg( const std::string& err_msg )
  {
    return set_err( e_err_invalid, 0, err_msg );
  }

  inline bool error::set_err_msg( const std::string& err_msg, int errcode )
  {
    std::string msg = err_msg;
    msg += " [";
    msg += std::to_string( errcode );
    msg += ' ';
    msg += strerror( errcode );
    msg += ']';
    return set_err( e_err_invalid, 0, msg );
  }

  inline bool error::set_err(
      err_kind_t kind, uint64_t code, const std::string& err_msg )
  {
    err_msg_  = err_msg;
    err_kind_ = kind;
    err_code_ = code;
    err_ix_   = -1;
    is_err_   = true;
    return false;
  }

  inline bool error::set_err( const error& err )
  {
    int ix = err.err_ix_;
    set_err( err.err_kind_, err.err_code_, err.err_msg_ );
    err_ix_ = ix;
    return false;
  }

  inline std::string error::get_err_msg() const
  {
    return err_msg_;
  }

  inline err_kind_t error::get_err_kind() const
  {
    return err_kind_;
  }

  inline uint64_t error::get_err_code() const
  {
    return err_code_;
  }

  inline void error::set_err_ix( int ix )
  {
    err_ix_ = ix;
  }

  inline int error::get_err_ix() const
  {
    return err_ix_;
  }

}
