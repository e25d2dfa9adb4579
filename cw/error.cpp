#include "error.hpp"
#include <write_account/write_account.h>

namespace cw
{

const char *err_code_name( uint64_t code )
{
  switch( code ) {
    case CW_SUCCESS:                   return "Success";
    case CW_ERR_ALREADY_INITIALIZED:   return "AlreadyInitialized";
    case CW_ERR_CAPACITY_TOO_SMALL:    return "CapacityTooSmall";
    case CW_ERR_ACCOUNT_SIZE:          return "AccountSize";
    case CW_ERR_UNAUTHORIZED:          return "Unauthorized";
    case CW_ERR_OUT_OF_ORDER_WRITE:    return "OutOfOrderWrite";
    case CW_ERR_OVERFLOW:              return "Overflow";
    case CW_ERR_NOT_INITIALIZED:       return "NotInitialized";
    case CW_ERR_INVALID_INSTRUCTION:   return "InvalidInstruction";
    case CW_ERR_UNRECOGNIZED_VERSION:  return "UnrecognizedVersion";
    case CW_ERR_WRONG_TARGET_PROGRAM:  return "WrongTargetProgram";
    case CW_ERR_INCOMPLETE:            return "Incomplete";
    case CW_ERR_WRITER_MISMATCH:       return "WriterMismatch";
    case CW_ERR_INCORRECT_OWNER:       return "IncorrectOwner";
    default:                           return "Unknown";
  }
}

const char *err_kind_name( err_kind_t kind )
{
  switch( kind ) {
    case e_err_none:      return "none";
    case e_err_protocol:  return "protocol";
    case e_err_transient: return "transient";
    case e_err_integrity: return "integrity";
    case e_err_cancelled: return "cancelled";
    case e_err_invalid:   return "invalid";
  }
  return "unknown";
}

}
