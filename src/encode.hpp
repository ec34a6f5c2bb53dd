#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace asterism
{

  // Keys are concatenations of big-endian integers and raw byte strings so
  // that LMDB's lexicographic order matches numeric order and prefix scans
  // select one node, one type or one indexed value.

  inline void put_be64(std::string &s, uint64_t x)
  {
    for (int shift = 56; shift >= 0; shift -= 8)
      s.push_back(static_cast<char>((x >> shift) & 0xff));
  }

  inline void put_be32(std::string &s, uint32_t x)
  {
    for (int shift = 24; shift >= 0; shift -= 8)
      s.push_back(static_cast<char>((x >> shift) & 0xff));
  }

  inline uint32_t read_be32(const unsigned char *p)
  {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
  }

  inline uint64_t read_be64(const unsigned char *p)
  {
    return (uint64_t(read_be32(p)) << 32) | read_be32(p + 4);
  }

  namespace key_part
  {
    inline void append(std::string &k, uint64_t x) { put_be64(k, x); }
    inline void append(std::string &k, uint32_t x) { put_be32(k, x); }
    inline void append(std::string &k, std::string_view bytes) { k.append(bytes); }
  } // namespace key_part

  // make_key(uint64_t{1}, uint32_t{2}) -> 12 bytes. Integer arguments must be
  // exactly uint32_t or uint64_t.
  template <typename... Parts>
  std::string make_key(const Parts &...parts)
  {
    std::string k;
    (key_part::append(k, parts), ...);
    return k;
  }

  // nodes: <u64 nodeId>
  inline std::string key_nodes_be(uint64_t nodeId) { return make_key(nodeId); }

  // edgesBySrcType: <u64 src>|<u32 typeId>|<u64 dst>|<u64 edgeId>
  inline std::string key_edge_by_src_type_be(uint64_t src, uint32_t typeId, uint64_t dst, uint64_t edgeId)
  {
    return make_key(src, typeId, dst, edgeId);
  }

  // edgesByDstType: <u64 dst>|<u32 typeId>|<u64 src>|<u64 edgeId>
  inline std::string key_edge_by_dst_type_be(uint64_t dst, uint32_t typeId, uint64_t src, uint64_t edgeId)
  {
    return make_key(dst, typeId, src, edgeId);
  }

  // edgesById: <u64 edgeId>
  inline std::string key_edge_by_id_be(uint64_t edgeId) { return make_key(edgeId); }

  // relTypeIds / propKeyIds / indexIds: <u32 id>
  inline std::string key_u32_be(uint32_t id) { return make_key(id); }

  // indexEntries: <u32 indexId>|<u32 keyId>|<encoded value>|<u64 nodeId>
  // Encoded values are self-delimiting, so the key without the node id is an
  // exact-match prefix. Long values are replaced by a fixed-width digest and
  // the entry's data holds the full encoding (see indexed_value in store.cpp).
  inline std::string key_index_entry_prefix_be(uint32_t indexId, uint32_t keyId, std::string_view encodedValue)
  {
    return make_key(indexId, keyId, encodedValue);
  }

  inline std::string key_index_entry_be(uint32_t indexId, uint32_t keyId, std::string_view encodedValue, uint64_t nodeId)
  {
    return make_key(indexId, keyId, encodedValue, nodeId);
  }

  // nodeIndexEntries: <u64 nodeId>|<u32 indexId>|<u32 keyId>|<encoded value>
  inline std::string key_node_index_entry_be(uint64_t nodeId, uint32_t indexId, uint32_t keyId, std::string_view encodedValue)
  {
    return make_key(nodeId, indexId, keyId, encodedValue);
  }

  // meta table keys
  namespace meta_key
  {
    constexpr const char *kSchemaVersion = "schemaVersion";
    constexpr const char *kNodeSeq = "nodeSeq";
    constexpr const char *kEdgeSeq = "edgeSeq";
    constexpr const char *kRelTypeSeq = "relTypeSeq";
    constexpr const char *kPropKeySeq = "propKeySeq";
    constexpr const char *kIndexSeq = "indexSeq";
  } // namespace meta_key

} // namespace asterism
