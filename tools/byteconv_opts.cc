#include <fstream>
#include <sstream>
#include <utility>
#include <boost/program_options.hpp>
#include "libbyteconv/except.h"
#include "byteconv_opts.h"

using namespace byteconv;
using namespace boost::program_options;

Byteconv_opts::Byteconv_opts():
  generic_opts_("Options"),
  conv_opts_("Numeric conventions (command line or config file)"),
  help_(false),
  mode_(Mode::format),
  format_value_(),
  format_spec_(),
  parse_text_(),
  styles_(Number_styles::Integer),
  conventions_(Numeric_conventions::invariant())
{
  generic_opts_.add_options()
    ("help,h", "print usage")
    ("config,c", value<std::string>(), "INI file with convention settings")
    ("format-value", value<std::string>(), "value to format, 0..255")
    ("format,f", value<std::string>(&format_spec_)->default_value("G"),
       "format specifier: G, D, E, F, N or X with optional precision")
    ("parse,p", value<std::string>(&parse_text_), "text to parse")
    ("style,s", value<std::string>()->default_value("Integer"),
       "number styles, e.g. Integer, HexNumber, Currency, AllowThousands|AllowLeadingWhite");

  conv_opts_.add_options()
    ("negative-sign", value<std::string>())
    ("positive-sign", value<std::string>())
    ("decimal-separator", value<std::string>())
    ("group-separator", value<std::string>())
    ("currency-symbol", value<std::string>())
    ("decimal-digits", value<int>());
}

Byteconv_opts::~Byteconv_opts() = default;

std::string Byteconv_opts::usage() const
{
  std::ostringstream ss;
  ss << "Usage: byteconv --format-value N [--format SPEC] | --parse TEXT [--style STYLES]\n"
     << generic_opts_ << conv_opts_;
  return ss.str();
}

void Byteconv_opts::configure(int argc, const char* const* argv)
{
  options_description all;
  all.add(generic_opts_).add(conv_opts_);

  variables_map vm;
  try {
    // Command line first: values stored earlier take precedence.
    store(parse_command_line(argc, argv, all), vm);

    if (vm.count("config")) {
      const std::string path = vm["config"].as<std::string>();
      std::ifstream cfg(path);
      if (!cfg)
        throw_bad_config("cannot open config file '" + path + "'");
      store(parse_config_file(cfg, conv_opts_), vm);
    }

    notify(vm);
  }
  catch (const boost::program_options::error& e) {
    throw_bad_config(e.what());
  }

  help_ = vm.count("help") != 0;
  if (help_)
    return;

  const bool has_format = vm.count("format-value") != 0;
  const bool has_parse = vm.count("parse") != 0;

  if (has_format == has_parse)
    throw_bad_config("exactly one of --format-value and --parse is required");

  apply_conventions(vm);

  try {
    styles_ = styles_from_string(vm["style"].as<std::string>());
    validate_styles(styles_);
  }
  catch (const Invalid_style& e) {
    throw_bad_config(e.what());
  }

  if (has_parse) {
    mode_ = Mode::parse;
    return;
  }

  mode_ = Mode::format;
  const std::string raw = vm["format-value"].as<std::string>();
  if (!Byte::try_parse(raw, Number_styles::Integer, Numeric_conventions::invariant().get(),
                       format_value_))
  {
    throw_bad_config("--format-value must be an integer in range 0..255, got '" + raw + "'");
  }
}

void Byteconv_opts::apply_conventions(const variables_map& vm)
{
  auto conv = std::make_shared<Numeric_conventions>(*Numeric_conventions::invariant());

  if (vm.count("negative-sign"))
    conv->set_negative_sign(vm["negative-sign"].as<std::string>());
  if (vm.count("positive-sign"))
    conv->set_positive_sign(vm["positive-sign"].as<std::string>());
  if (vm.count("decimal-separator"))
    conv->set_decimal_separator(vm["decimal-separator"].as<std::string>());
  if (vm.count("group-separator"))
    conv->set_group_separator(vm["group-separator"].as<std::string>());
  if (vm.count("currency-symbol"))
    conv->set_currency_symbol(vm["currency-symbol"].as<std::string>());

  if (vm.count("decimal-digits")) {
    try {
      conv->set_number_decimal_digits(vm["decimal-digits"].as<int>());
    }
    catch (const Numeric_conventions::Bad_value& e) {
      throw_bad_config(e.what());
    }
  }

  conventions_ = std::move(conv);
}

void Byteconv_opts::throw_bad_config(const std::string& reason) const
{
  std::ostringstream ss;
  ss << "byteconv: " << reason << "\n\n" << usage();
  throw Bad_config(ss.str());
}
