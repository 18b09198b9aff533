#include <iostream>
#include "byteconv_app.h"
#include "byteconv_opts.h"

int main(int argc, char** argv)
{
  Byteconv_opts opts;

  try {
    opts.configure(argc, argv);
  }
  catch (const Byteconv_opts::Bad_config& e) {
    std::cerr << e.what();
    return Byteconv_app::bad_config;
  }

  if (opts.help()) {
    std::cout << opts.usage();
    return Byteconv_app::ok;
  }

  Byteconv_app app;
  app.log_errors( &std::cerr );
  return app.run( opts, std::cout );
}
