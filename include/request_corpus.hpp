#pragma once

#include <nlohmann/json.hpp>
#include <random>
#include <string>
#include <vector>

namespace httpload {

// Parameters of one request, drawn per request
struct RequestSpec {
  std::string url;
  std::string body;

  bool operator==(const RequestSpec &other) const {
    return url == other.url && body == other.body;
  }
};

// Entry loaded from a corpus file. An empty url means "use the default".
struct CorpusEntry {
  std::string url;
  std::string body;
};

/**
 * In-memory table of request parameters. Immutable after loading, so
 * workers sample it concurrently without locking.
 */
class RequestCorpus {
public:
  RequestCorpus() = default;
  explicit RequestCorpus(std::vector<CorpusEntry> entries);

  /**
   * @brief Load a corpus from a JSON file.
   *
   * Accepts `["body", ...]` or `[["url", "body"], ...]`. An unreadable or
   * malformed file is logged and yields an empty corpus.
   */
  static RequestCorpus loadFromFile(const std::string &path);

  /**
   * @brief Parse an in-memory document.
   * @throws ValidationException when the document has an unsupported shape.
   */
  static RequestCorpus fromJson(const nlohmann::json &document);

  /**
   * @brief Draw one request uniformly at random.
   *
   * An empty corpus yields `{defaultUrl, ""}`; entries without a URL get
   * @p defaultUrl substituted.
   */
  template <typename Engine>
  RequestSpec sample(const std::string &defaultUrl, Engine &rng) const {
    if (entries_.empty()) {
      return {defaultUrl, ""};
    }
    std::uniform_int_distribution<size_t> pick(0, entries_.size() - 1);
    return resolve(entries_[pick(rng)], defaultUrl);
  }

  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<CorpusEntry> &entries() const { return entries_; }

private:
  std::vector<CorpusEntry> entries_;

  static RequestSpec resolve(const CorpusEntry &entry,
                             const std::string &defaultUrl);
};

} // namespace httpload
