#ifndef APPICON_CONSOLE_HPP
#define APPICON_CONSOLE_HPP

#include <iostream>
#include <string>

namespace appicon {

enum class Verbosity {
    Quiet,
    Normal,
    Verbose,
};

// Progress goes to |out|, errors to |err|. Errors are printed at every
// verbosity.
class Console {
public:
    Console(std::ostream& out = std::cout, std::ostream& err = std::cerr, Verbosity verbosity = Verbosity::Normal)
        : out_(out)
        , err_(err)
        , verbosity_(verbosity)
    {
    }

    void progress(const std::string& line) const
    {
        if (verbosity_ != Verbosity::Quiet) {
            out_ << line << std::endl;
        }
    }

    void detail(const std::string& line) const
    {
        if (verbosity_ == Verbosity::Verbose) {
            out_ << "  " << line << std::endl;
        }
    }

    void error(const std::string& line) const { err_ << line << std::endl; }

    Verbosity verbosity() const { return verbosity_; }

private:
    std::ostream& out_;
    std::ostream& err_;
    Verbosity verbosity_;
};

} // namespace appicon

#endif
