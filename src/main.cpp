#include "client.hpp"
#include "server.hpp"
#include <capnp/ez-rpc.h>
#include <kj/async-io.h>
#include <kj/main.h>
#include <kj/debug.h>
#include <filesystem>
#include <optional>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace
{

  constexpr const char *kUnixPrefix = "unix:";

  bool isUnixBind(const char *bind)
  {
    return std::strncmp(bind, kUnixPrefix, std::strlen(kUnixPrefix)) == 0;
  }

  // "4096", "512K", "64M", "16G"
  std::optional<size_t> parseByteSize(const char *text)
  {
    char *end = nullptr;
    unsigned long long n = std::strtoull(text, &end, 10);
    if (end == text || n == 0)
      return std::nullopt;
    switch (*end)
    {
    case '\0':
      break;
    case 'K':
    case 'k':
      n <<= 10;
      ++end;
      break;
    case 'M':
    case 'm':
      n <<= 20;
      ++end;
      break;
    case 'G':
    case 'g':
      n <<= 30;
      ++end;
      break;
    default:
      return std::nullopt;
    }
    if (*end != '\0')
      return std::nullopt;
    return static_cast<size_t>(n);
  }

} // namespace

class AsterismdApp
{
public:
  explicit AsterismdApp(kj::ProcessContext &context) : context_(context) {}

  kj::MainFunc getMain()
  {
    return kj::MainBuilder(context_, "0.1", "asterism graph store daemon serving the GraphStore RPC interface")
        .addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, optVerbose),
                   "log at INFO level")
        .addOptionWithArg({'b', "bind"}, KJ_BIND_METHOD(*this, optBind),
                          "<addr>", "listen on <addr>: unix:<path> or <host>:<port> (default: unix:/tmp/asterism.sock)")
        .addOptionWithArg({'d', "data"}, KJ_BIND_METHOD(*this, optData),
                          "<dir>", "store directory, created if missing (default: data)")
        .addOptionWithArg({'m', "map-size"}, KJ_BIND_METHOD(*this, optMapSize),
                          "<bytes>", "LMDB map size, with optional K, M or G suffix (default: 16G)")
        .callAfterParsing(KJ_BIND_METHOD(*this, serve))
        .build();
  }

private:
  kj::ProcessContext &context_;
  kj::String bind_ = kj::heapString("unix:/tmp/asterism.sock");
  kj::String dataDir_ = kj::heapString("data");
  size_t mapSize_ = asterism::kDefaultMapSize;

  kj::MainBuilder::Validity optVerbose()
  {
    context_.increaseLoggingVerbosity();
    return true;
  }

  kj::MainBuilder::Validity optBind(kj::StringPtr value)
  {
    if (value.size() == 0)
      return kj::MainBuilder::Validity("empty bind address");
    bind_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optData(kj::StringPtr value)
  {
    dataDir_ = kj::heapString(value);
    return true;
  }

  kj::MainBuilder::Validity optMapSize(kj::StringPtr value)
  {
    auto size = parseByteSize(value.cStr());
    if (!size)
      return kj::MainBuilder::Validity("map size must be a positive byte count");
    mapSize_ = *size;
    return true;
  }

  kj::MainBuilder::Validity serve()
  {
    try
    {
      asterism::LocalStoreClient local(std::filesystem::path(dataDir_.cStr()), mapSize_);

      const char *bind = bind_.cStr();
      if (isUnixBind(bind))
        ::unlink(bind + std::strlen(kUnixPrefix));

      capnp::EzRpcServer server(kj::heap<asterism::rpc::GraphStoreImpl>(local), bind);
      auto &waitScope = server.getWaitScope();
      if (isUnixBind(bind))
        KJ_LOG(INFO, "asterismd listening", bind);
      else
        KJ_LOG(INFO, "asterismd listening", bind, server.getPort().wait(waitScope));
      kj::NEVER_DONE.wait(waitScope);
    }
    catch (const std::exception &e)
    {
      KJ_LOG(ERROR, "asterismd stopped", e.what());
      return kj::MainBuilder::Validity(kj::str("fatal: ", e.what()));
    }
    return true;
  }
};

KJ_MAIN(AsterismdApp);
