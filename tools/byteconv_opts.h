#ifndef BYTECONV_TOOL_OPTS_H
#define BYTECONV_TOOL_OPTS_H

#include <memory>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

#include "libbyteconv/byte.h"
#include "libbyteconv/conventions.h"
#include "libbyteconv/number_styles.h"

//! Command line / config file settings of the byteconv tool.
class Byteconv_opts {
public:
  class Bad_config;

  enum class Mode { format, parse };

  Byteconv_opts();
  ~Byteconv_opts();

  Byteconv_opts(const Byteconv_opts&) = delete;
  Byteconv_opts& operator=(const Byteconv_opts&) = delete;

  //! Throws Bad_config with the reason and usage text.
  void configure(int argc, const char* const* argv);

  bool help() const { return help_; }
  std::string usage() const;

  Mode mode() const { return mode_; }
  byteconv::Byte format_value() const { return format_value_; }
  const std::string& format_spec() const { return format_spec_; }
  const std::string& parse_text() const { return parse_text_; }
  byteconv::Number_styles styles() const { return styles_; }

  std::shared_ptr<const byteconv::Numeric_conventions> conventions() const
  {
    return conventions_;
  }

private:
  [[noreturn]] void throw_bad_config(const std::string& reason) const;
  void apply_conventions(const boost::program_options::variables_map&);

  boost::program_options::options_description generic_opts_;
  boost::program_options::options_description conv_opts_;

  bool help_;
  Mode mode_;
  byteconv::Byte format_value_;
  std::string format_spec_;
  std::string parse_text_;
  byteconv::Number_styles styles_;
  std::shared_ptr<const byteconv::Numeric_conventions> conventions_;
};

class Byteconv_opts::Bad_config: public std::runtime_error {
public:
  explicit Bad_config(const std::string& usage):
    runtime_error(usage) {}
};

#endif
