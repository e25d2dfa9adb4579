#pragma once

#include <cw/key_pair.hpp>
#include <cw/error.hpp>

namespace cw
{

  // directory of key files used by the command-line tool
  class key_store : public error
  {
  public:

    key_store();

    // create/chmod key_store directory
    bool create();

    // initialize
    bool init();

    // directory where to store account keys
    void set_dir( const std::string& dir_name );
    std::string get_dir() const;

    // file names
    std::string get_writer_key_pair_file() const;
    std::string get_program_pub_key_file() const;
    std::string get_account_key_pair_file( const pub_key& ) const;
    std::string get_closed_account_key_pair_file( const pub_key& ) const;

    // writer and fee payer key
    key_pair *create_writer_key_pair();
    key_pair *get_writer_key_pair();
    pub_key  *get_writer_pub_key();

    // write-account program id
    pub_key  *get_program_pub_key();

    // chunk account keys kept so that uploads can be resumed
    bool create_account_key_pair( key_pair& );
    bool get_account_key_pair( const pub_key&, key_pair& );

    // closed accounts keep their key file under a different name so the
    // account is never created again under the same key
    bool mark_account_closed( const pub_key& );
    bool get_is_account_closed( const pub_key& ) const;

  private:

    bool write_key_file( const std::string&, const key_pair& );

    bool        has_wkey_;
    bool        has_gpub_;
    key_pair    wkey_; // writer key
    pub_key     wpub_; // writer public key
    pub_key     gpub_; // program id
    std::string dir_;  // key store directory
  };

}
