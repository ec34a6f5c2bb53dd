#pragma once
#include "value.hpp"
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace asterism
{

  struct QueryError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  struct QueryTerm
  {
    std::string key{};
    Value val{};
  };

  // Conjunction of equality terms, rendered to the store-native expression
  //   name:"alice" AND age:42 AND score:0.5 AND active:true
  class Query
  {
  public:
    Query() = default;
    Query(std::string key, Value val);

    Query &operator&=(const Query &other);
    friend Query operator&(Query lhs, const Query &rhs)
    {
      lhs &= rhs;
      return lhs;
    }

    const std::vector<QueryTerm> &terms() const { return terms_; }
    bool empty() const { return terms_.empty(); }
    std::string str() const;

  private:
    std::vector<QueryTerm> terms_;
  };

  std::string renderQueryValue(const Value &v);

  // Inverse of Query::str(); throws QueryError on malformed input.
  std::vector<QueryTerm> parseQuery(std::string_view expression);

} // namespace asterism
