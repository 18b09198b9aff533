#ifndef BYTECONV_TOOL_APP_H
#define BYTECONV_TOOL_APP_H

#include <iosfwd>
#include <mutex>
#include <string>

class Byteconv_opts;

//! Runs one conversion described by Byteconv_opts.
class Byteconv_app {
public:
  enum Exit_code { ok = 0, conversion_failed = 1, bad_config = 2 };

  Byteconv_app();

  //! Set stream to log errors. Transfer NULL to turn logging off.
  void log_errors( std::ostream* );

  //! Writes the result line to out; failures are logged.
  int run( const Byteconv_opts&, std::ostream& out );

private:
  void log_err_msg( const std::string& );

  std::mutex log_mutex;
  std::ostream* log;
};

#endif
