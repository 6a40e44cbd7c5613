#include "diag_sink/formatters/pattern_formatter.hpp"

#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "diag_sink/log_level.hpp"
#include "diag_sink/timestamp.hpp"

namespace diag_sink
{

namespace
{

class Cursor
{
 public:
  Cursor(char* buf, size_t cap) : buf_(buf), cap_(cap) {}

  void Put(const char* src, size_t len)
  {
    if (pos_ + 1 >= cap_) return;
    size_t room = cap_ - 1 - pos_;
    size_t n = len < room ? len : room;
    std::memcpy(buf_ + pos_, src, n);
    pos_ += n;
  }

  void Put(const char* s)
  {
    if (s) Put(s, std::strlen(s));
  }

  void Put(std::string_view sv) { Put(sv.data(), sv.size()); }

  size_t Finish()
  {
    buf_[pos_] = '\0';
    return pos_;
  }

 private:
  char* buf_;
  size_t cap_;
  size_t pos_ = 0;
};

const char* ColorFor(LogLevel level)
{
  switch (level)
  {
    case LogLevel::Trace:
      return "\033[37m";
    case LogLevel::Debug:
      return "\033[36m";
    case LogLevel::Info:
      return "\033[32m";
    case LogLevel::Warn:
      return "\033[33m";
    case LogLevel::Error:
      return "\033[31m";
    case LogLevel::Fatal:
      return "\033[1;31m";
    default:
      return "";
  }
}

}  // namespace

PatternFormatter::PatternFormatter(std::string_view pattern, bool enable_color)
    : pattern_(pattern), enable_color_(enable_color)
{
  Compile();
}

void PatternFormatter::Compile()
{
  pieces_.clear();
  std::string literal;

  auto flush_literal = [&]()
  {
    if (!literal.empty())
    {
      pieces_.push_back({Token::Literal, literal});
      literal.clear();
    }
  };

  for (size_t i = 0; i < pattern_.size(); ++i)
  {
    char c = pattern_[i];
    if (c != '%' || i + 1 == pattern_.size())
    {
      literal += c;
      continue;
    }

    char spec = pattern_[++i];
    Token token = Token::Literal;
    switch (spec)
    {
      case 'D':
        token = Token::Date;
        break;
      case 'T':
        token = Token::Time;
        break;
      case 'e':
        token = Token::Micros;
        break;
      case 'L':
        token = Token::Level;
        break;
      case 'l':
        token = Token::LevelChar;
        break;
      case 'f':
        token = Token::File;
        break;
      case '#':
        token = Token::Line;
        break;
      case 'n':
        token = Token::Function;
        break;
      case 't':
        token = Token::ThreadId;
        break;
      case 'q':
        token = Token::Sequence;
        break;
      case 'm':
        token = Token::Message;
        break;
      case 'C':
        token = Token::ColorOn;
        break;
      case 'R':
        token = Token::ColorOff;
        break;
      case '%':
        literal += '%';
        continue;
      default:
        literal += '%';
        literal += spec;
        continue;
    }
    flush_literal();
    pieces_.push_back({token, {}});
  }
  flush_literal();
}

size_t PatternFormatter::Format(const LogEntry& entry, char* buf, size_t buf_size)
{
  if (buf_size == 0) return 0;

  Cursor out(buf, buf_size);
  char tmp[64];

  for (const auto& piece : pieces_)
  {
    switch (piece.token)
    {
      case Token::Literal:
        out.Put(piece.text);
        break;
      case Token::Date:
        out.Put(tmp, FormatDate(entry.wall_clock_ns, tmp, sizeof(tmp)));
        break;
      case Token::Time:
        out.Put(tmp, FormatTime(entry.wall_clock_ns, tmp, sizeof(tmp)));
        break;
      case Token::Micros:
      {
        auto us = static_cast<unsigned>((entry.wall_clock_ns / 1000ULL) % 1'000'000ULL);
        int n = std::snprintf(tmp, sizeof(tmp), ".%06u", us);
        if (n > 0) out.Put(tmp, static_cast<size_t>(n));
        break;
      }
      case Token::Level:
        out.Put(ToString(entry.level));
        break;
      case Token::LevelChar:
      {
        char c = ToShortChar(entry.level);
        out.Put(&c, 1);
        break;
      }
      case Token::File:
        out.Put(entry.file_name);
        break;
      case Token::Line:
      {
        int n = std::snprintf(tmp, sizeof(tmp), "%u", entry.line);
        if (n > 0) out.Put(tmp, static_cast<size_t>(n));
        break;
      }
      case Token::Function:
        out.Put(entry.function_name);
        break;
      case Token::ThreadId:
      {
        int n = std::snprintf(tmp, sizeof(tmp), "%u", entry.thread_id);
        if (n > 0) out.Put(tmp, static_cast<size_t>(n));
        break;
      }
      case Token::Sequence:
      {
        int n = std::snprintf(tmp, sizeof(tmp), "%" PRIu64, entry.sequence_id);
        if (n > 0) out.Put(tmp, static_cast<size_t>(n));
        break;
      }
      case Token::Message:
        out.Put(entry.msg, entry.msg_len);
        break;
      case Token::ColorOn:
        if (enable_color_) out.Put(ColorFor(entry.level));
        break;
      case Token::ColorOff:
        if (enable_color_) out.Put("\033[0m");
        break;
    }
  }

  return out.Finish();
}

}  // namespace diag_sink
