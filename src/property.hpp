#pragma once
#include "value.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace asterism
{

  enum class PropertyKind : uint8_t
  {
    String = 0,
    Integer = 1,
    Float = 2,
    Boolean = 3
  };

  enum class Indexing : uint8_t
  {
    None = 0,
    Index = 1,
    UniqueIndex = 2
  };

  // Declaration flags; uniqueIndex excludes both index and blank.
  struct PropertyOptions
  {
    bool uniqueIndex{false};
    bool index{false};
    bool blank{false};
  };

  const char *kindName(PropertyKind kind);

  class PropertyDescriptor
  {
  public:
    // throws SchemaError for an empty name or conflicting options
    PropertyDescriptor(std::string name, PropertyKind kind, PropertyOptions opts = {});

    const std::string &name() const { return name_; }
    PropertyKind kind() const { return kind_; }
    Indexing indexing() const { return indexing_; }
    bool blank() const { return blank_; }
    bool isIndexed() const { return indexing_ != Indexing::None; }
    bool isUnique() const { return indexing_ == Indexing::UniqueIndex; }

    // Throws InvalidType unless v holds exactly the declared kind. Null
    // passes only for blank properties.
    void validate(const Value &v) const;

  private:
    std::string name_;
    PropertyKind kind_;
    Indexing indexing_{Indexing::None};
    bool blank_{false};
  };

  inline PropertyDescriptor stringProperty(std::string name, PropertyOptions opts = {})
  {
    return PropertyDescriptor(std::move(name), PropertyKind::String, opts);
  }

  inline PropertyDescriptor integerProperty(std::string name, PropertyOptions opts = {})
  {
    return PropertyDescriptor(std::move(name), PropertyKind::Integer, opts);
  }

  inline PropertyDescriptor floatProperty(std::string name, PropertyOptions opts = {})
  {
    return PropertyDescriptor(std::move(name), PropertyKind::Float, opts);
  }

  inline PropertyDescriptor booleanProperty(std::string name, PropertyOptions opts = {})
  {
    return PropertyDescriptor(std::move(name), PropertyKind::Boolean, opts);
  }

} // namespace asterism
