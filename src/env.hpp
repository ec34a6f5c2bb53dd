#pragma once
#include <array>
#include <cstddef>
#include <filesystem>
#include <stdexcept>

struct MDB_env;
struct MDB_txn;
using DbHandle = unsigned int;

namespace asterism
{

  struct MdbError : std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  // Named databases of a store directory. Layouts are described in encode.hpp.
  enum class Table : size_t
  {
    Nodes,
    EdgesBySrcType,
    EdgesByDstType,
    EdgesById,
    RelTypeIds,
    RelTypesByName,
    PropKeyIds,
    PropKeysByName,
    IndexIds,
    IndexesByName,
    IndexEntries,
    NodeIndexEntries,
    Meta,
    Count
  };

  constexpr size_t kDefaultMapSize = size_t(16ull << 30);

  // Aborted on destruction unless committed.
  class Txn
  {
  public:
    Txn(MDB_env *env, bool rw);
    ~Txn() noexcept;
    Txn(const Txn &) = delete;
    Txn &operator=(const Txn &) = delete;

    MDB_txn *get() const { return txn_; }
    void commit();
    void abort() noexcept;

  private:
    MDB_txn *txn_{};
  };

  // One LMDB environment with every table opened up front.
  class Env
  {
  public:
    explicit Env(const std::filesystem::path &path, size_t mapSizeBytes = kDefaultMapSize);
    ~Env() noexcept;
    Env(const Env &) = delete;
    Env &operator=(const Env &) = delete;

    MDB_env *raw() const { return env_; }
    DbHandle table(Table t) const { return tables_[static_cast<size_t>(t)]; }
    const std::filesystem::path &path() const { return path_; }

  private:
    std::filesystem::path path_;
    MDB_env *env_{};
    std::array<DbHandle, static_cast<size_t>(Table::Count)> tables_{};
  };

} // namespace asterism
