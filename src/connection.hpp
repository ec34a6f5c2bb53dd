#pragma once
#include "client.hpp"
#include "schema.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace asterism
{

  // Store client, schema registry and category anchor cache for one store.
  //
  // The process-wide connection is built from ASTERISM_URL on the first call
  // to instance() and lives until shutdown(). A Connection may also be built
  // directly around any StoreClient. None of this is synchronised beyond the
  // one-time construction of the process-wide instance.
  class Connection
  {
  public:
    static constexpr const char *kUrlEnv = "ASTERISM_URL";
    static constexpr const char *kCategoryIndex = "Category";
    static constexpr const char *kCategoryKey = "category";

    explicit Connection(std::unique_ptr<StoreClient> client);
    ~Connection();

    Connection(const Connection &) = delete;
    Connection &operator=(const Connection &) = delete;

    // Throws ConnectionError when ASTERISM_URL is unset or unusable. A failed
    // attempt leaves nothing behind, so a later call retries.
    static Connection &instance();
    static void shutdown();

    //   lmdb:<dir>     embedded store in <dir>
    //   unix:<path>    RPC over a unix socket
    //   <host>:<port>  RPC over TCP
    static std::unique_ptr<StoreClient> connect(const std::string &url);

    StoreClient &client() { return *client_; }
    SchemaRegistry &schemas() { return *schemas_; }

    const SchemaEntry &define(TypeDescriptor desc) { return schemas_->define(std::move(desc)); }

    // id of the anchor node grouping every instance of typeName
    uint64_t category(const std::string &typeName);

  private:
    std::unique_ptr<StoreClient> client_;
    std::unique_ptr<SchemaRegistry> schemas_;
    std::optional<uint32_t> categoryIndex_;
    std::map<std::string, uint64_t> categories_;
  };

} // namespace asterism
