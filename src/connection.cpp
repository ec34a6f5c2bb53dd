#include "connection.hpp"
#include "errors.hpp"
#include "rpc_client.hpp"
#include <kj/debug.h>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace asterism
{

  namespace
  {

    std::mutex instanceMutex;
    std::unique_ptr<Connection> instancePtr;

  } // namespace

  Connection::Connection(std::unique_ptr<StoreClient> client)
      : client_(std::move(client)), schemas_(std::make_unique<SchemaRegistry>(*this))
  {
    if (!client_)
      throw ConnectionError("connection needs a store client");
  }

  Connection::~Connection() = default;

  std::unique_ptr<StoreClient> Connection::connect(const std::string &url)
  {
    if (url.empty())
      throw ConnectionError("empty store url");
    if (url.rfind("lmdb:", 0) == 0)
    {
      auto dir = url.substr(5);
      if (dir.empty())
        throw ConnectionError("store url '" + url + "' names no directory");
      return std::make_unique<LocalStoreClient>(std::filesystem::path(dir));
    }
    if (url.rfind("unix:", 0) == 0)
    {
      if (url.size() == 5)
        throw ConnectionError("store url '" + url + "' names no socket");
      return std::make_unique<RpcStoreClient>(url);
    }
    auto colon = url.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == url.size())
      throw ConnectionError("store url '" + url + "' is neither lmdb:<dir>, unix:<path> nor <host>:<port>");
    return std::make_unique<RpcStoreClient>(url);
  }

  Connection &Connection::instance()
  {
    std::lock_guard<std::mutex> lock(instanceMutex);
    if (instancePtr)
      return *instancePtr;

    const char *url = std::getenv(kUrlEnv);
    if (url == nullptr || std::strlen(url) == 0)
      throw ConnectionError(std::string(kUrlEnv) + " is not set");

    std::unique_ptr<StoreClient> client;
    try
    {
      client = connect(url);
    }
    catch (const ConnectionError &)
    {
      throw;
    }
    catch (const std::exception &e)
    {
      throw ConnectionError(std::string("cannot open store at ") + url + ": " + e.what());
    }
    instancePtr = std::make_unique<Connection>(std::move(client));
    KJ_LOG(INFO, "connected", url);
    return *instancePtr;
  }

  void Connection::shutdown()
  {
    std::lock_guard<std::mutex> lock(instanceMutex);
    instancePtr.reset();
  }

  uint64_t Connection::category(const std::string &typeName)
  {
    auto it = categories_.find(typeName);
    if (it != categories_.end())
      return it->second;

    if (!categoryIndex_)
      categoryIndex_ = client_->getOrCreateIndex(kCategoryIndex);

    PropertyMap props{{kCategoryKey, Value{typeName}}};
    auto res = client_->getOrCreateIndexedNode(*categoryIndex_, kCategoryKey, Value{typeName}, props);
    if (res.created)
      KJ_LOG(INFO, "created category anchor", typeName.c_str(), res.node.id);
    categories_.emplace(typeName, res.node.id);
    return res.node.id;
  }

} // namespace asterism
