#include <ostream>
#include "libbyteconv/byte.h"
#include "libbyteconv/except.h"
#include "byteconv_app.h"
#include "byteconv_opts.h"

using namespace byteconv;

Byteconv_app::Byteconv_app():
  log(nullptr)
{
}

void Byteconv_app::log_errors( std::ostream* log_ )
{
  std::lock_guard<std::mutex> lock(log_mutex);
  log = log_;
}

void Byteconv_app::log_err_msg( const std::string& msg )
{
  std::lock_guard<std::mutex> lock(log_mutex);
  if( log )
    *log << msg << '\n';
}

int Byteconv_app::run( const Byteconv_opts& opts, std::ostream& out )
{
  const auto conv = opts.conventions();

  try {
    if( opts.mode() == Byteconv_opts::Mode::parse )
    {
      Byte b = Byte::parse( opts.parse_text(), opts.styles(), conv.get() );
      out << b << '\n';
    }
    else
    {
      out << opts.format_value().to_string( opts.format_spec(), conv.get() ) << '\n';
    }
  }
  catch( const Invalid_style& e )
  {
    log_err_msg( std::string("byteconv: ") + e.what() );
    return bad_config;
  }
  catch( const byteconv::Exception& e )
  {
    log_err_msg( std::string("byteconv: ") + e.what() );
    return conversion_failed;
  }

  return ok;
}
