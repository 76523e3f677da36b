#ifndef SINK_DOT_HPP
#define SINK_DOT_HPP

#include <memory>

#include "Handler.hpp"

// Takes everything, keeps nothing.

class Sink : public Handler {
public:
  static std::unique_ptr<Sink> from_cli(args_t const& args)
  {
    if (!args.empty())
      throw usage_error("Sink handler does not accept arguments");
    return std::make_unique<Sink>();
  }

  void message_complete(Transaction const&) override {}
};

#endif // SINK_DOT_HPP
