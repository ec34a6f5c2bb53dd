#include "store.hpp"
#include "encode.hpp"
#include <lmdb.h>
#include <algorithm>
#include <cstring>
#include <string_view>
#include <unordered_set>
#include <kj/debug.h>

namespace asterism
{
  namespace
  {
    // Cursor bound to a transaction; closed on scope exit.
    class Cursor
    {
    public:
      Cursor(Txn &tx, DbHandle dbi)
      {
        int rc = mdb_cursor_open(tx.get(), dbi, &cur_);
        if (rc)
          throw MdbError(mdb_strerror(rc));
      }
      ~Cursor() noexcept { mdb_cursor_close(cur_); }
      Cursor(const Cursor &) = delete;
      Cursor &operator=(const Cursor &) = delete;

      MDB_cursor *get() const { return cur_; }

    private:
      MDB_cursor *cur_{};
    };

    struct Dictionary
    {
      DbHandle ids;
      DbHandle byName;
      std::string seqKey;
      const char *notFound;
    };

    bool has_prefix(const MDB_val &k, std::string_view prefix)
    {
      return k.mv_size >= prefix.size() && std::memcmp(k.mv_data, prefix.data(), prefix.size()) == 0;
    }
  } // namespace

  // -------------------- meta helpers (schema, sequences) --------------------

  static std::string read_string_by_id(Txn &tx, DbHandle idsDbi, uint32_t id)
  {
    std::string idk = key_u32_be(id);
    MDB_val k{idk.size(), const_cast<char *>(idk.data())}, v{};
    int rc = mdb_get(tx.get(), idsDbi, &k, &v);
    if (rc == MDB_NOTFOUND)
      throw MdbError("id not found");
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return std::string(static_cast<const char *>(v.mv_data), v.mv_size);
  }

  static bool mdb_get_val(MDB_txn *tx, DbHandle dbi, std::string_view key, MDB_val &out)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    int rc = mdb_get(tx, dbi, &k, &out);
    if (rc == MDB_NOTFOUND)
      return false;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    return true;
  }

  static void put_or_throw(MDB_txn *tx, DbHandle dbi, std::string_view key, std::string_view value)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    MDB_val v{value.size(), const_cast<char *>(value.data())};
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static void del_if_present(MDB_txn *tx, DbHandle dbi, std::string_view key)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    int rc = mdb_del(tx, dbi, &k, nullptr);
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  static uint64_t read_u64_or(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t fallback)
  {
    MDB_val v{};
    if (!mdb_get_val(tx, dbi, key, v) || v.mv_size != 8)
      return fallback;
    uint64_t x = 0;
    std::memcpy(&x, v.mv_data, 8);
    return x;
  }

  static void write_u64(MDB_txn *tx, DbHandle dbi, std::string_view key, uint64_t value)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    MDB_val v{8, &value};
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static void write_u32(MDB_txn *tx, DbHandle dbi, std::string_view key, uint32_t value)
  {
    MDB_val k{key.size(), const_cast<char *>(key.data())};
    MDB_val v{4, &value};
    int rc = mdb_put(tx, dbi, &k, &v, 0);
    if (rc)
      throw MdbError(mdb_strerror(rc));
  }

  static void ensure_schema_version(Txn &tx, Env &env)
  {
    auto key = meta_key::kSchemaVersion;
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.table(Table::Meta), key, v))
    {
      uint32_t version = 1u;
      write_u32(tx.get(), env.table(Table::Meta), key, version);
    }
  }

  static uint64_t incr_meta_seq(Txn &tx, Env &env, const std::string &key, uint64_t initial = 0)
  {
    ensure_schema_version(tx, env);
    uint64_t current = read_u64_or(tx.get(), env.table(Table::Meta), key, initial);
    uint64_t next = current + 1;
    write_u64(tx.get(), env.table(Table::Meta), key, next);
    return next;
  }

  static uint64_t next_node_id(Txn &tx, Env &env)
  {
    return incr_meta_seq(tx, env, meta_key::kNodeSeq, 0);
  }

  static uint64_t next_edge_id(Txn &tx, Env &env)
  {
    return incr_meta_seq(tx, env, meta_key::kEdgeSeq, 0);
  }

  // -------------------- name/id dictionary helpers --------------------

  static std::optional<uint32_t> lookup_id_by_name(Txn &tx, DbHandle byNameDbi, std::string_view name)
  {
    MDB_val k{name.size(), const_cast<char *>(name.data())}, v{};
    int rc = mdb_get(tx.get(), byNameDbi, &k, &v);
    if (rc == MDB_NOTFOUND)
      return std::nullopt;
    if (rc)
      throw MdbError(mdb_strerror(rc));
    if (v.mv_size != 4)
      throw MdbError("corrupt dictionary id value");
    return read_be32(static_cast<const unsigned char *>(v.mv_data));
  }

  static void write_name_id_pair(Txn &tx, DbHandle idsDbi, DbHandle byNameDbi, uint32_t id, std::string_view name)
  {
    put_or_throw(tx.get(), idsDbi, key_u32_be(id), name);

    // name -> id (big-endian 4 bytes)
    std::string idbe;
    idbe.reserve(4);
    put_be32(idbe, id);
    put_or_throw(tx.get(), byNameDbi, name, idbe);
  }

  static uint32_t get_or_create_dict_id(Env &env, const Dictionary &dict, const std::string &name, bool createIfMissing)
  {
    if (name.empty())
      throw MdbError("dictionary names must not be empty");
    if (!createIfMissing)
    {
      Txn tx(env.raw(), false);
      if (auto found = lookup_id_by_name(tx, dict.byName, name))
        return *found;
      throw MdbError(dict.notFound);
    }
    Txn tx(env.raw(), true);
    if (auto found = lookup_id_by_name(tx, dict.byName, name))
      return *found;
    uint32_t id = static_cast<uint32_t>(incr_meta_seq(tx, env, dict.seqKey, 0));
    write_name_id_pair(tx, dict.ids, dict.byName, id, name);
    tx.commit();
    return id;
  }

  // -------------------- value/record encoding --------------------

  enum class ValueTag : uint8_t
  {
    I64 = 0,
    F64 = 1,
    Bool = 2,
    Text = 3,
    Null = 4,
    Digest = 5 // index keys only
  };

  static void encode_value(std::string &out, const Value &v)
  {
    if (std::holds_alternative<int64_t>(v))
    {
      out.push_back(char(ValueTag::I64));
      put_be64(out, static_cast<uint64_t>(std::get<int64_t>(v)));
      return;
    }
    if (std::holds_alternative<double>(v))
    {
      out.push_back(char(ValueTag::F64));
      double d = std::get<double>(v);
      if (d == 0.0)
        d = 0.0; // -0.0 and 0.0 share one index key
      static_assert(sizeof(double) == 8, "double not 8 bytes");
      uint64_t ux;
      std::memcpy(&ux, &d, 8);
      put_be64(out, ux);
      return;
    }
    if (std::holds_alternative<bool>(v))
    {
      out.push_back(char(ValueTag::Bool));
      out.push_back(std::get<bool>(v) ? 1 : 0);
      return;
    }
    if (std::holds_alternative<std::string>(v))
    {
      out.push_back(char(ValueTag::Text));
      const auto &s = std::get<std::string>(v);
      put_be32(out, static_cast<uint32_t>(s.size()));
      out.append(s);
      return;
    }
    out.push_back(char(ValueTag::Null));
  }

  static std::string encoded(const Value &v)
  {
    std::string s;
    encode_value(s, v);
    return s;
  }

  // Index keys hold the encoded value inline up to this size. LMDB caps keys
  // at mdb_env_get_maxkeysize (511 by default).
  constexpr size_t kMaxInlineIndexValue = 256;
  constexpr size_t kDigestPrefixBytes = 64;

  static uint64_t fnv1a64(std::string_view bytes)
  {
    uint64_t h = 14695981039346656037ull;
    for (unsigned char c : bytes)
    {
      h ^= c;
      h *= 1099511628211ull;
    }
    return h;
  }

  // Key form of an indexed value. Long encodings become
  // Digest|<u32 len>|<first 64 bytes>|<u64 fnv1a>, and the full encoding is
  // stored as the index entry's data so lookups can reject collisions.
  namespace
  {
    struct IndexedValue
    {
      std::string key;
      std::string full; // empty when the value is inline
    };
  } // namespace

  static IndexedValue indexed_value(const Value &v)
  {
    std::string enc = encoded(v);
    if (enc.size() <= kMaxInlineIndexValue)
      return IndexedValue{std::move(enc), {}};

    IndexedValue out{};
    out.key.push_back(char(ValueTag::Digest));
    put_be32(out.key, static_cast<uint32_t>(enc.size()));
    out.key.append(enc, 0, kDigestPrefixBytes);
    put_be64(out.key, fnv1a64(enc));
    out.full = std::move(enc);
    return out;
  }

  static const unsigned char *decode_value(const unsigned char *p, const unsigned char *end, Value &out)
  {
    if (p >= end)
      throw MdbError("corrupt value: empty");
    auto tag = static_cast<ValueTag>(*p++);
    switch (tag)
    {
    case ValueTag::I64:
    {
      if (end - p < 8)
        throw MdbError("corrupt i64");
      out = static_cast<int64_t>(read_be64(p));
      return p + 8;
    }
    case ValueTag::F64:
    {
      if (end - p < 8)
        throw MdbError("corrupt f64");
      uint64_t ux = read_be64(p);
      double d;
      std::memcpy(&d, &ux, 8);
      out = d;
      return p + 8;
    }
    case ValueTag::Bool:
    {
      if (end - p < 1)
        throw MdbError("corrupt bool");
      out = bool(*p++ != 0);
      return p;
    }
    case ValueTag::Text:
    {
      if (end - p < 4)
        throw MdbError("corrupt text len");
      uint32_t len = read_be32(p);
      p += 4;
      if (end - p < static_cast<std::ptrdiff_t>(len))
        throw MdbError("corrupt text data");
      out = std::string(reinterpret_cast<const char *>(p), len);
      return p + len;
    }
    case ValueTag::Null:
      out = std::monostate{};
      return p;
    default:
      throw MdbError("unknown value tag");
    }
  }

  // keeps the last value per key, ordered by keyId
  static std::vector<Property> normalize_props(const std::vector<Property> &in)
  {
    std::vector<Property> out;
    out.reserve(in.size());
    for (const auto &p : in)
    {
      auto it = std::find_if(out.begin(), out.end(), [&](const Property &q)
                             { return q.keyId == p.keyId; });
      if (it != out.end())
        it->val = p.val;
      else
        out.push_back(p);
    }
    std::sort(out.begin(), out.end(), [](const Property &a, const Property &b)
              { return a.keyId < b.keyId; });
    return out;
  }

  // <u64 id>|<u32 count>|(<u32 keyId><value>)*
  static std::string encode_node_record(const NodeRecord &n)
  {
    std::string s;
    s.reserve(8 + 4 + n.props.size() * 16);
    put_be64(s, n.id);
    put_be32(s, static_cast<uint32_t>(n.props.size()));
    for (const auto &p : n.props)
    {
      put_be32(s, p.keyId);
      encode_value(s, p.val);
    }
    return s;
  }

  static NodeRecord decode_node_record(std::string_view bytes)
  {
    const unsigned char *p = reinterpret_cast<const unsigned char *>(bytes.data());
    const unsigned char *end = p + bytes.size();
    if (end - p < 12)
      throw MdbError("corrupt node record");
    NodeRecord n{};
    n.id = read_be64(p);
    uint32_t count = read_be32(p + 8);
    p += 12;
    n.props.reserve(count);
    for (uint32_t i = 0; i < count; ++i)
    {
      if (end - p < 4)
        throw MdbError("corrupt prop keyId");
      Property pr{};
      pr.keyId = read_be32(p);
      p = decode_value(p + 4, end, pr.val);
      n.props.push_back(std::move(pr));
    }
    if (p != end)
      throw MdbError("trailing data in node record");
    return n;
  }

  // -------------------- transaction-scoped helpers --------------------

  static std::optional<NodeRecord> read_node(Txn &tx, Env &env, uint64_t id)
  {
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.table(Table::Nodes), key_nodes_be(id), v))
      return std::nullopt;
    return decode_node_record(std::string_view(static_cast<const char *>(v.mv_data), v.mv_size));
  }

  static NodeRecord load_node(Txn &tx, Env &env, uint64_t id)
  {
    auto n = read_node(tx, env, id);
    if (!n)
      throw MdbError("node not found: " + std::to_string(id));
    return std::move(*n);
  }

  static void write_node(Txn &tx, Env &env, const NodeRecord &n)
  {
    put_or_throw(tx.get(), env.table(Table::Nodes), key_nodes_be(n.id), encode_node_record(n));
  }

  static std::optional<EdgeRef> read_edge(Txn &tx, Env &env, uint64_t edgeId)
  {
    MDB_val v{};
    if (!mdb_get_val(tx.get(), env.table(Table::EdgesById), key_edge_by_id_be(edgeId), v))
      return std::nullopt;
    if (v.mv_size != 28)
      throw MdbError("corrupt edge ref");
    const unsigned char *p = static_cast<const unsigned char *>(v.mv_data);
    EdgeRef ref{};
    ref.id = read_be64(p);
    ref.src = read_be64(p + 8);
    ref.dst = read_be64(p + 16);
    ref.typeId = read_be32(p + 24);
    return ref;
  }

  static EdgeRef insert_edge(Txn &tx, Env &env, uint64_t src, uint64_t dst, uint32_t typeId)
  {
    if (typeId == 0)
      throw MdbError("edge type required");
    MDB_val ignored{};
    if (!mdb_get_val(tx.get(), env.table(Table::Nodes), key_nodes_be(src), ignored) ||
        !mdb_get_val(tx.get(), env.table(Table::Nodes), key_nodes_be(dst), ignored))
      throw MdbError("edge endpoint not found");

    EdgeRef ref{next_edge_id(tx, env), src, dst, typeId};

    // edgesById: id|src|dst|typeId
    std::string refv;
    refv.reserve(28);
    put_be64(refv, ref.id);
    put_be64(refv, ref.src);
    put_be64(refv, ref.dst);
    put_be32(refv, ref.typeId);
    put_or_throw(tx.get(), env.table(Table::EdgesById), key_edge_by_id_be(ref.id), refv);

    // type indexes
    put_or_throw(tx.get(), env.table(Table::EdgesBySrcType), key_edge_by_src_type_be(ref.src, typeId, ref.dst, ref.id), {});
    put_or_throw(tx.get(), env.table(Table::EdgesByDstType), key_edge_by_dst_type_be(ref.dst, typeId, ref.src, ref.id), {});
    return ref;
  }

  static bool delete_edge(Txn &tx, Env &env, uint64_t edgeId)
  {
    auto ref = read_edge(tx, env, edgeId);
    if (!ref)
      return false;
    del_if_present(tx.get(), env.table(Table::EdgesBySrcType), key_edge_by_src_type_be(ref->src, ref->typeId, ref->dst, ref->id));
    del_if_present(tx.get(), env.table(Table::EdgesByDstType), key_edge_by_dst_type_be(ref->dst, ref->typeId, ref->src, ref->id));
    del_if_present(tx.get(), env.table(Table::EdgesById), key_edge_by_id_be(ref->id));
    return true;
  }

  // Scans one of the two edge indexes for edges anchored at params.node.
  static void scan_edges(Txn &tx, Env &env, const ListEdgesParams &params, bool outgoing,
                         std::vector<EdgeRef> &out, std::unordered_set<uint64_t> &seen)
  {
    Cursor cur(tx, outgoing ? env.table(Table::EdgesBySrcType) : env.table(Table::EdgesByDstType));
    std::string prefix;
    put_be64(prefix, params.node);
    if (params.typeId != 0)
    {
      put_be32(prefix, params.typeId);
      if (params.other != 0)
        put_be64(prefix, params.other);
    }
    MDB_val k{prefix.size(), const_cast<char *>(prefix.data())}, v{};
    int rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
    while (rc == 0)
    {
      if (params.limit != 0 && out.size() >= params.limit)
        break;
      if (!has_prefix(k, prefix) || k.mv_size != 8 + 4 + 8 + 8)
        break;
      const unsigned char *kb = static_cast<const unsigned char *>(k.mv_data);
      uint64_t major = read_be64(kb + 0);
      uint32_t typeId = read_be32(kb + 8);
      uint64_t neighbor = read_be64(kb + 12);
      uint64_t edgeId = read_be64(kb + 20);
      if ((params.other == 0 || neighbor == params.other) && seen.insert(edgeId).second)
      {
        EdgeRef ref{};
        ref.id = edgeId;
        ref.src = outgoing ? major : neighbor;
        ref.dst = outgoing ? neighbor : major;
        ref.typeId = typeId;
        out.push_back(ref);
      }
      rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
    }
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  static std::vector<EdgeRef> list_edges(Txn &tx, Env &env, const ListEdgesParams &params)
  {
    std::vector<EdgeRef> out;
    std::unordered_set<uint64_t> seen;
    if (params.direction == Direction::Out || params.direction == Direction::Both)
      scan_edges(tx, env, params, true, out, seen);
    if (params.direction == Direction::In || params.direction == Direction::Both)
      scan_edges(tx, env, params, false, out, seen);
    return out;
  }

  static void put_index_entry(Txn &tx, Env &env, uint32_t indexId, uint32_t keyId, const IndexedValue &iv, uint64_t node)
  {
    put_or_throw(tx.get(), env.table(Table::IndexEntries), key_index_entry_be(indexId, keyId, iv.key, node), iv.full);
    put_or_throw(tx.get(), env.table(Table::NodeIndexEntries), key_node_index_entry_be(node, indexId, keyId, iv.key), {});
  }

  // Node ids indexed under <indexId>|<keyId>|<value>.
  static std::vector<uint64_t> lookup_index(Txn &tx, Env &env, uint32_t indexId, uint32_t keyId, const IndexedValue &iv, uint32_t limit)
  {
    std::vector<uint64_t> ids;
    std::string prefix = key_index_entry_prefix_be(indexId, keyId, iv.key);
    Cursor cur(tx, env.table(Table::IndexEntries));
    MDB_val k{prefix.size(), const_cast<char *>(prefix.data())}, v{};
    int rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
    while (rc == 0)
    {
      if (limit != 0 && ids.size() >= limit)
        break;
      if (!has_prefix(k, prefix))
        break;
      if (k.mv_size != prefix.size() + 8)
        throw MdbError("corrupt index entry");
      bool match = iv.full.empty() ||
                   std::string_view(static_cast<const char *>(v.mv_data), v.mv_size) == iv.full;
      if (match)
        ids.push_back(read_be64(static_cast<const unsigned char *>(k.mv_data) + prefix.size()));
      rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
    }
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
    return ids;
  }

  // Drops every index entry of a node, optionally restricted to one index.
  static void remove_node_index_entries(Txn &tx, Env &env, uint64_t node, std::optional<uint32_t> indexId)
  {
    Cursor cur(tx, env.table(Table::NodeIndexEntries));
    std::string prefix;
    put_be64(prefix, node);
    if (indexId)
      put_be32(prefix, *indexId);
    MDB_val k{prefix.size(), const_cast<char *>(prefix.data())}, v{};
    int rc = mdb_cursor_get(cur.get(), &k, &v, MDB_SET_RANGE);
    while (rc == 0)
    {
      if (!has_prefix(k, prefix))
        break;
      if (k.mv_size < 8 + 4 + 4 + 1)
        throw MdbError("corrupt node index entry");
      const unsigned char *kb = static_cast<const unsigned char *>(k.mv_data);
      uint32_t idx = read_be32(kb + 8);
      uint32_t keyId = read_be32(kb + 12);
      std::string_view enc(reinterpret_cast<const char *>(kb + 16), k.mv_size - 16);
      del_if_present(tx.get(), env.table(Table::IndexEntries), key_index_entry_be(idx, keyId, enc, node));

      int drc = mdb_cursor_del(cur.get(), 0);
      if (drc)
        throw MdbError(mdb_strerror(drc));
      rc = mdb_cursor_get(cur.get(), &k, &v, MDB_NEXT);
    }
    if (rc != 0 && rc != MDB_NOTFOUND)
      throw MdbError(mdb_strerror(rc));
  }

  static void delete_node(Txn &tx, Env &env, uint64_t id)
  {
    if (!read_node(tx, env, id))
      throw MdbError("node not found: " + std::to_string(id));

    // detach remaining edges where node is src or dst
    ListEdgesParams incident{};
    incident.node = id;
    incident.direction = Direction::Both;
    for (const auto &e : list_edges(tx, env, incident))
      delete_edge(tx, env, e.id);

    remove_node_index_entries(tx, env, id, std::nullopt);
    del_if_present(tx.get(), env.table(Table::Nodes), key_nodes_be(id));
  }

  // -------------------- api ---------------------------

  CreateNodeResult Store::createNode(const CreateNodeParams &params)
  {
    Txn tx(env_.raw(), true);
    CreateNodeResult out{};
    out.node.id = next_node_id(tx, env_);
    out.node.props = normalize_props(params.props);
    write_node(tx, env_, out.node);

    if (params.link)
    {
      const auto &l = *params.link;
      if (l.direction == Direction::Both)
        throw MdbError("node link needs a direction");
      if (l.direction == Direction::In)
        out.edge = insert_edge(tx, env_, l.other, out.node.id, l.typeId);
      else
        out.edge = insert_edge(tx, env_, out.node.id, l.other, l.typeId);
    }

    tx.commit();
    return out;
  }

  void Store::setNodeProps(const SetNodePropsParams &params)
  {
    Txn tx(env_.raw(), true);
    NodeRecord n = load_node(tx, env_, params.id);
    n.props = normalize_props(params.props);
    write_node(tx, env_, n);
    tx.commit();
  }

  EdgeRef Store::addEdge(const AddEdgeParams &params)
  {
    Txn tx(env_.raw(), true);
    EdgeRef ref = insert_edge(tx, env_, params.src, params.dst, params.typeId);
    tx.commit();
    return ref;
  }

  GetOrCreateEdgeResult Store::getOrCreateEdge(const AddEdgeParams &params)
  {
    Txn tx(env_.raw(), true);
    ListEdgesParams q{};
    q.node = params.src;
    q.direction = Direction::Out;
    q.typeId = params.typeId;
    q.other = params.dst;
    q.limit = 1;
    auto existing = list_edges(tx, env_, q);
    if (!existing.empty())
      return GetOrCreateEdgeResult{existing.front(), false};

    GetOrCreateEdgeResult out{insert_edge(tx, env_, params.src, params.dst, params.typeId), true};
    tx.commit();
    return out;
  }

  void Store::deleteEntities(const DeleteEntitiesParams &params)
  {
    Txn tx(env_.raw(), true);
    for (uint64_t eid : params.edgeIds)
    {
      if (!delete_edge(tx, env_, eid))
        KJ_LOG(INFO, "edge already gone", eid);
    }
    for (uint64_t nid : params.nodeIds)
      delete_node(tx, env_, nid);
    tx.commit();
  }

  NodeRecord Store::getNode(const GetNodeParams &params)
  {
    Txn tx(env_.raw(), false);
    return load_node(tx, env_, params.id);
  }

  std::vector<NodeRecord> Store::getNodes(const std::vector<uint64_t> &ids)
  {
    Txn tx(env_.raw(), false);
    std::vector<NodeRecord> out;
    out.reserve(ids.size());
    for (uint64_t id : ids)
    {
      if (auto n = read_node(tx, env_, id))
        out.push_back(std::move(*n));
    }
    return out;
  }

  EdgeRef Store::getEdge(uint64_t edgeId)
  {
    Txn tx(env_.raw(), false);
    auto ref = read_edge(tx, env_, edgeId);
    if (!ref)
      throw MdbError("edge not found: " + std::to_string(edgeId));
    return *ref;
  }

  ListEdgesResult Store::listEdges(const ListEdgesParams &params)
  {
    Txn tx(env_.raw(), false);
    ListEdgesResult out{};
    out.edges = list_edges(tx, env_, params);
    return out;
  }

  RelatedNodesResult Store::relatedNodes(const ListEdgesParams &params)
  {
    Txn tx(env_.raw(), false);
    RelatedNodesResult out{};
    std::unordered_set<uint64_t> seen;
    for (const auto &e : list_edges(tx, env_, params))
    {
      uint64_t neighbor = (e.src == params.node) ? e.dst : e.src;
      if (!seen.insert(neighbor).second)
        continue;
      if (auto n = read_node(tx, env_, neighbor))
        out.nodes.push_back(std::move(*n));
    }
    return out;
  }

  IndexBatchResult Store::applyIndexBatch(const IndexBatchParams &params)
  {
    Txn tx(env_.raw(), true);
    IndexBatchResult out{};
    out.statuses.reserve(params.ops.size());
    for (const auto &op : params.ops)
    {
      MDB_val ignored{};
      if (!mdb_get_val(tx.get(), env_.table(Table::Nodes), key_nodes_be(op.node), ignored))
        throw MdbError("indexed node not found: " + std::to_string(op.node));

      IndexedValue iv = indexed_value(op.val);
      if (op.kind == IndexOpKind::InsertIfAbsent)
      {
        if (!lookup_index(tx, env_, params.indexId, op.keyId, iv, 1).empty())
        {
          out.statuses.push_back(IndexOpStatus::Exists);
          continue;
        }
      }
      put_index_entry(tx, env_, params.indexId, op.keyId, iv, op.node);
      out.statuses.push_back(IndexOpStatus::Inserted);
    }
    tx.commit();
    return out;
  }

  void Store::removeFromIndex(const RemoveFromIndexParams &params)
  {
    Txn tx(env_.raw(), true);
    remove_node_index_entries(tx, env_, params.node, params.indexId);
    tx.commit();
  }

  QueryIndexResult Store::queryIndex(const QueryIndexParams &params)
  {
    if (params.terms.empty())
      throw MdbError("index query needs at least one term");

    Txn tx(env_.raw(), false);
    QueryIndexResult out{};
    std::vector<uint64_t> candidates;
    for (size_t i = 0; i < params.terms.size(); ++i)
    {
      const auto &t = params.terms[i];
      auto ids = lookup_index(tx, env_, params.indexId, t.keyId, indexed_value(t.val), 0);
      if (i == 0)
      {
        candidates = std::move(ids);
      }
      else
      {
        std::unordered_set<uint64_t> match(ids.begin(), ids.end());
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](uint64_t id)
                                        { return match.count(id) == 0; }),
                         candidates.end());
      }
      if (candidates.empty())
        return out;
    }
    if (params.limit != 0 && candidates.size() > params.limit)
      candidates.resize(params.limit);
    out.nodeIds = std::move(candidates);
    return out;
  }

  GetOrCreateIndexedNodeResult Store::getOrCreateIndexedNode(const GetOrCreateIndexedNodeParams &params)
  {
    Txn tx(env_.raw(), true);
    IndexedValue iv = indexed_value(params.val);
    auto existing = lookup_index(tx, env_, params.indexId, params.keyId, iv, 1);
    if (!existing.empty())
      return GetOrCreateIndexedNodeResult{load_node(tx, env_, existing.front()), false};

    GetOrCreateIndexedNodeResult out{};
    out.created = true;
    out.node.id = next_node_id(tx, env_);
    out.node.props = normalize_props(params.props);
    write_node(tx, env_, out.node);
    put_index_entry(tx, env_, params.indexId, params.keyId, iv, out.node.id);
    tx.commit();
    return out;
  }

  uint32_t Store::getOrCreateRelTypeId(const GetOrCreateRelTypeIdParams &params)
  {
    return get_or_create_dict_id(env_, Dictionary{env_.table(Table::RelTypeIds), env_.table(Table::RelTypesByName), meta_key::kRelTypeSeq, "rel type not found"},
                                 params.name, params.createIfMissing);
  }

  uint32_t Store::getOrCreatePropKeyId(const GetOrCreatePropKeyIdParams &params)
  {
    return get_or_create_dict_id(env_, Dictionary{env_.table(Table::PropKeyIds), env_.table(Table::PropKeysByName), meta_key::kPropKeySeq, "prop key not found"},
                                 params.name, params.createIfMissing);
  }

  uint32_t Store::getOrCreateIndexId(const GetOrCreateIndexIdParams &params)
  {
    return get_or_create_dict_id(env_, Dictionary{env_.table(Table::IndexIds), env_.table(Table::IndexesByName), meta_key::kIndexSeq, "index not found"},
                                 params.name, params.createIfMissing);
  }

  std::optional<uint32_t> Store::findRelTypeId(const std::string &name)
  {
    Txn tx(env_.raw(), false);
    return lookup_id_by_name(tx, env_.table(Table::RelTypesByName), name);
  }

  std::optional<uint32_t> Store::findPropKeyId(const std::string &name)
  {
    Txn tx(env_.raw(), false);
    return lookup_id_by_name(tx, env_.table(Table::PropKeysByName), name);
  }

  std::string Store::getRelTypeName(uint32_t id)
  {
    Txn tx(env_.raw(), false);
    return read_string_by_id(tx, env_.table(Table::RelTypeIds), id);
  }

  std::string Store::getPropKeyName(uint32_t id)
  {
    Txn tx(env_.raw(), false);
    return read_string_by_id(tx, env_.table(Table::PropKeyIds), id);
  }

} // namespace asterism
