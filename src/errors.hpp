#pragma once
#include "value.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>

namespace asterism
{

  // Base of every error raised by the mapping layer. Store and transport
  // failures (MdbError, kj::Exception) are not wrapped.
  struct OgmError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Invalid type or property declaration, unknown type name.
  struct SchemaError : OgmError
  {
    using OgmError::OgmError;
  };

  // ASTERISM_URL missing or unusable.
  struct ConnectionError : OgmError
  {
    using OgmError::OgmError;
  };

  struct NoSuchProperty : OgmError
  {
    NoSuchProperty(const std::string &typeName, const std::string &prop)
        : OgmError(typeName + " has no property '" + prop + "'"), property(prop) {}
    std::string property;
  };

  struct InvalidType : OgmError
  {
    InvalidType(const std::string &prop, const char *expected, const Value &got)
        : OgmError("property '" + prop + "' expects " + expected + ", got " + valueTypeName(got)),
          property(prop) {}
    std::string property;
  };

  struct PropertyNotIndexed : OgmError
  {
    explicit PropertyNotIndexed(const std::string &prop)
        : OgmError("property '" + prop + "' is not indexed"), property(prop) {}
    std::string property;
  };

  struct NotUnique : OgmError
  {
    NotUnique(const std::string &prop, const Value &val)
        : OgmError("value " + describeValue(val) + " of unique property '" + prop + "' already exists"),
          property(prop), value(val) {}
    std::string property;
    Value value;
  };

  struct NodeNotPersisted : OgmError
  {
    explicit NodeNotPersisted(const std::string &what) : OgmError(what) {}
  };

  struct TypeMismatch : OgmError
  {
    TypeMismatch(const std::string &expected, const std::string &got)
        : OgmError("expecting node of type " + expected + ", got " + got) {}
  };

  struct MultipleRelationships : OgmError
  {
    MultipleRelationships(const std::string &relationType, size_t count)
        : OgmError("expected a single " + relationType + " relationship, found " + std::to_string(count)) {}
  };

  struct NotFound : OgmError
  {
    explicit NotFound(const std::string &query) : OgmError("no node matches " + query) {}
  };

  struct MultipleResults : OgmError
  {
    MultipleResults(const std::string &query, size_t count)
        : OgmError(std::to_string(count) + " nodes match " + query + ", expected one") {}
  };

} // namespace asterism
