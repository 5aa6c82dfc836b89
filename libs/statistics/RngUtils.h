#pragma once

#include <cstdint>
#include <cstddef>
#include <random>
#include <array>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace stratvalidator
{
  namespace rng_utils
  {
    /**
     * @brief Get a random index in [0, hiExclusive).
     *
     * Uses std::uniform_int_distribution on the engine to avoid modulo bias
     * and to behave correctly for both 32-bit and 64-bit engines.
     *
     * @pre hiExclusive > 0
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      // Precondition guard (no-throw fallback): if 0, return 0.
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(rng);
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x) {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts) {
      uint64_t h = 0x6a09e667f3bcc909ull; // arbitrary IV
      for (auto v : parts) h = splitmix64(h ^ v);
      return h;
    }

    // FNV-1a over the bytes of a label, e.g. a strategy identifier
    inline uint64_t tag_from_string(const std::string& label)
    {
      uint64_t h = 0xcbf29ce484222325ull;
      for (unsigned char c : label)
	{
	  h ^= static_cast<uint64_t>(c);
	  h *= 0x100000001b3ull;
	}
      return h;
    }

    /**
     * @brief Master seed plus an immutable list of 64-bit tags.
     *
     * Two keys with the same master seed and tags always derive the same
     * per-replicate seeds, so results are reproducible across runs and
     * independent of thread scheduling.
     */
    class CRNKey
    {
    public:
      CRNKey(uint64_t masterSeed, std::vector<uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      CRNKey with_tag(uint64_t tag) const
      {
	auto t = m_tags; t.push_back(tag);
	return CRNKey(m_masterSeed, std::move(t));
      }

      // Derive a 64-bit seed for a given replicate index (replicate is just another tag)
      uint64_t make_seed_for(std::size_t replicate) const
      {
	uint64_t h = m_masterSeed;
	for (auto v : m_tags) h = hash_combine64({h, v});
	h = hash_combine64({h, static_cast<uint64_t>(replicate)});
	return h;
      }

    private:
      uint64_t m_masterSeed;
      std::vector<uint64_t> m_tags;
    };

    inline std::seed_seq make_seed_seq(uint64_t seed64)
    {
      // Expand a 64-bit seed into eight 32-bit words using diversified SplitMix64
      const uint64_t s0 = seed64;
      const uint64_t s1 = splitmix64(s0);
      const uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
      const uint64_t s3 = splitmix64(s0 + 0xd1342543de82ef95ull);
      const uint64_t s4 = splitmix64(s1 ^ 0x94d049bb133111ebull);
      const uint64_t s5 = splitmix64(s2 + 0xbf58476d1ce4e5b9ull);
      const uint64_t s6 = splitmix64(s3 ^ 0x6a09e667f3bcc909ull);
      const uint64_t s7 = splitmix64(s4 + 0x243f6a8885a308d3ull);

      const uint64_t mix = (s3 ^ s5 ^ s6 ^ s7);

      std::array<uint32_t, 8> words = {
	static_cast<uint32_t>(s0), static_cast<uint32_t>(s0 >> 32),
	static_cast<uint32_t>(s1), static_cast<uint32_t>(s1 >> 32),
	static_cast<uint32_t>(s2), static_cast<uint32_t>(s2 >> 32),
	static_cast<uint32_t>(mix), static_cast<uint32_t>(mix >> 32)
      };

      return std::seed_seq(words.begin(), words.end());
    }

    template<class Eng = std::mt19937_64>
    inline Eng make_seeded_engine(uint64_t seed64)
    {
      auto sseq = make_seed_seq(seed64);
      return Eng(sseq);
    }

    // Use the caller's seed when present; otherwise draw one from the OS.
    inline uint64_t resolve_seed(const std::optional<uint64_t>& seed)
    {
      if (seed)
	return *seed;

      std::random_device rd;
      return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }

    // Constructs one deterministic engine per replicate index from a CRNKey
    template<class Eng = std::mt19937_64>
    class CRNEngineProvider
    {
    public:
      using Engine = Eng;

      explicit CRNEngineProvider(CRNKey key)
	:  m_key(std::move(key))
      {}

      Engine make_engine(std::size_t replicate) const
      {
	return make_seeded_engine<Engine>(m_key.make_seed_for(replicate));
      }

    private:
      CRNKey m_key;
    };
  } // namespace rng_utils
} // namespace stratvalidator
