#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "formatter_interface.hpp"

namespace diag_sink
{

// %D date   %T time   %e .microseconds   %L level   %l level char
// %f file   %# line   %n function   %t thread id   %q sequence
// %m message   %C colour start   %R colour reset   %% literal '%'
class PatternFormatter : public IFormatter
{
 public:
  static constexpr std::string_view kDefaultPattern = "[%D %T%e] [%C%L%R] [tid:%t] [%f:%#] %m";

  explicit PatternFormatter(std::string_view pattern = kDefaultPattern,
                            bool enable_color = true);

  size_t Format(const LogEntry& entry, char* buf, size_t buf_size) override;

 private:
  enum class Token : uint8_t
  {
    Literal,
    Date,
    Time,
    Micros,
    Level,
    LevelChar,
    File,
    Line,
    Function,
    ThreadId,
    Sequence,
    Message,
    ColorOn,
    ColorOff
  };

  struct Piece
  {
    Token token;
    std::string text;
  };

  std::string pattern_;
  bool enable_color_;
  std::vector<Piece> pieces_;

  void Compile();
};

}  // namespace diag_sink
