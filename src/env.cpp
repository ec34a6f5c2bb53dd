#include "env.hpp"
#include <lmdb.h>
#include <string>

namespace asterism
{
  namespace
  {
    // indexed by Table
    constexpr const char *kTableNames[] = {
        "nodes",
        "edgesBySrcType",
        "edgesByDstType",
        "edgesById",
        "relTypeIds",
        "relTypesByName",
        "propKeyIds",
        "propKeysByName",
        "indexIds",
        "indexesByName",
        "indexEntries",
        "nodeIndexEntries",
        "meta",
    };
    static_assert(sizeof(kTableNames) / sizeof(kTableNames[0]) == static_cast<size_t>(Table::Count),
                  "every table needs a name");

    void check(int rc)
    {
      if (rc)
        throw MdbError(mdb_strerror(rc));
    }
  } // namespace

  Txn::Txn(MDB_env *env, bool rw)
  {
    check(mdb_txn_begin(env, nullptr, rw ? 0 : MDB_RDONLY, &txn_));
  }

  Txn::~Txn() noexcept
  {
    abort();
  }

  void Txn::commit()
  {
    MDB_txn *txn = txn_;
    txn_ = nullptr;
    check(mdb_txn_commit(txn));
  }

  void Txn::abort() noexcept
  {
    if (txn_)
    {
      mdb_txn_abort(txn_);
      txn_ = nullptr;
    }
  }

  Env::Env(const std::filesystem::path &path, size_t mapSizeBytes) : path_(path)
  {
    check(mdb_env_create(&env_));
    int rc = mdb_env_set_maxdbs(env_, static_cast<MDB_dbi>(Table::Count));
    if (!rc)
      rc = mdb_env_set_mapsize(env_, mapSizeBytes);
    if (!rc)
      rc = mdb_env_open(env_, path.c_str(), 0, 0664);
    if (rc)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw MdbError(std::string(mdb_strerror(rc)) + " (" + path.string() + ")");
    }

    try
    {
      Txn tx(env_, true);
      for (size_t i = 0; i < tables_.size(); ++i)
        check(mdb_dbi_open(tx.get(), kTableNames[i], MDB_CREATE, &tables_[i]));
      tx.commit();
    }
    catch (...)
    {
      mdb_env_close(env_);
      env_ = nullptr;
      throw;
    }
  }

  Env::~Env() noexcept
  {
    if (env_)
      mdb_env_close(env_);
  }

} // namespace asterism
