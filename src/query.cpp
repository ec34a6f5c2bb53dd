#include "query.hpp"
#include <charconv>
#include <cmath>
#include <cstring>

namespace asterism
{

  namespace
  {

    bool isKeyStart(char c)
    {
      return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
    }

    bool isKeyChar(char c)
    {
      return isKeyStart(c) || (c >= '0' && c <= '9') || c == '-' || c == '.';
    }

    void checkKey(const std::string &key)
    {
      if (key.empty() || !isKeyStart(key.front()))
        throw QueryError("invalid query key: '" + key + "'");
      for (char c : key)
      {
        if (!isKeyChar(c))
          throw QueryError("invalid query key: '" + key + "'");
      }
    }

    class Parser
    {
    public:
      explicit Parser(std::string_view s) : s_(s) {}

      std::vector<QueryTerm> run()
      {
        std::vector<QueryTerm> out;
        skipSpace();
        if (atEnd())
          throw QueryError("empty query");
        for (;;)
        {
          QueryTerm t{};
          t.key = key();
          expect(':');
          t.val = value();
          out.push_back(std::move(t));
          skipSpace();
          if (atEnd())
            break;
          if (!consumeWord("AND"))
            throw QueryError("expected AND at offset " + std::to_string(pos_));
          skipSpace();
        }
        return out;
      }

    private:
      bool atEnd() const { return pos_ >= s_.size(); }

      void skipSpace()
      {
        while (!atEnd() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n'))
          ++pos_;
      }

      void expect(char c)
      {
        if (atEnd() || s_[pos_] != c)
          throw QueryError(std::string("expected '") + c + "' at offset " + std::to_string(pos_));
        ++pos_;
      }

      bool consumeWord(std::string_view w)
      {
        if (s_.substr(pos_, w.size()) != w)
          return false;
        size_t after = pos_ + w.size();
        if (after < s_.size() && isKeyChar(s_[after]))
          return false;
        pos_ = after;
        return true;
      }

      std::string key()
      {
        size_t start = pos_;
        if (atEnd() || !isKeyStart(s_[pos_]))
          throw QueryError("expected key at offset " + std::to_string(pos_));
        while (!atEnd() && isKeyChar(s_[pos_]))
          ++pos_;
        return std::string(s_.substr(start, pos_ - start));
      }

      Value value()
      {
        if (atEnd())
          throw QueryError("missing value at end of query");
        char c = s_[pos_];
        if (c == '"')
          return text();
        if (consumeWord("true"))
          return true;
        if (consumeWord("false"))
          return false;
        if (consumeWord("null"))
          return std::monostate{};
        return number();
      }

      Value text()
      {
        ++pos_; // opening quote
        std::string out;
        while (!atEnd())
        {
          char c = s_[pos_++];
          if (c == '"')
            return out;
          if (c == '\\')
          {
            if (atEnd())
              break;
            char e = s_[pos_++];
            if (e != '"' && e != '\\')
              throw QueryError(std::string("bad escape \\") + e);
            out.push_back(e);
            continue;
          }
          out.push_back(c);
        }
        throw QueryError("unterminated string");
      }

      Value number()
      {
        size_t start = pos_;
        bool floating = false;
        while (!atEnd())
        {
          char c = s_[pos_];
          if (c == '.' || c == 'e' || c == 'E')
            floating = true;
          else if (!((c >= '0' && c <= '9') || c == '-' || c == '+'))
            break;
          ++pos_;
        }
        std::string_view tok = s_.substr(start, pos_ - start);
        if (tok.empty())
          throw QueryError("expected value at offset " + std::to_string(start));
        const char *b = tok.data();
        const char *e = tok.data() + tok.size();
        if (floating)
        {
          double d{};
          auto r = std::from_chars(b, e, d);
          if (r.ec != std::errc{} || r.ptr != e)
            throw QueryError("bad float '" + std::string(tok) + "'");
          return d;
        }
        int64_t i{};
        auto r = std::from_chars(b, e, i);
        if (r.ec != std::errc{} || r.ptr != e)
          throw QueryError("bad integer '" + std::string(tok) + "'");
        return i;
      }

      std::string_view s_;
      size_t pos_{0};
    };

  } // namespace

  Query::Query(std::string key, Value val)
  {
    checkKey(key);
    terms_.push_back(QueryTerm{std::move(key), std::move(val)});
  }

  Query &Query::operator&=(const Query &other)
  {
    terms_.insert(terms_.end(), other.terms_.begin(), other.terms_.end());
    return *this;
  }

  std::string renderQueryValue(const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
      return std::to_string(std::get<int64_t>(v));
    if (std::holds_alternative<double>(v))
    {
      double d = std::get<double>(v);
      if (!std::isfinite(d))
        throw QueryError("non-finite float cannot be queried");
      char buf[64];
      auto r = std::to_chars(buf, buf + sizeof(buf), d);
      std::string s(buf, r.ptr);
      if (s.find_first_of(".eE") == std::string::npos)
        s += ".0";
      return s;
    }
    if (std::holds_alternative<bool>(v))
      return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::string>(v))
    {
      const auto &raw = std::get<std::string>(v);
      std::string s;
      s.reserve(raw.size() + 2);
      s.push_back('"');
      for (char c : raw)
      {
        if (c == '"' || c == '\\')
          s.push_back('\\');
        s.push_back(c);
      }
      s.push_back('"');
      return s;
    }
    return "null";
  }

  std::string Query::str() const
  {
    std::string out;
    for (const auto &t : terms_)
    {
      if (!out.empty())
        out += " AND ";
      out += t.key;
      out += ':';
      out += renderQueryValue(t.val);
    }
    return out;
  }

  std::vector<QueryTerm> parseQuery(std::string_view expression)
  {
    return Parser(expression).run();
  }

} // namespace asterism
