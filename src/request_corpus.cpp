#include "request_corpus.hpp"
#include "httpload_exceptions.hpp"
#include "logger.hpp"
#include <fstream>

namespace httpload {

RequestCorpus::RequestCorpus(std::vector<CorpusEntry> entries)
    : entries_(std::move(entries)) {}

RequestSpec RequestCorpus::resolve(const CorpusEntry &entry,
                                   const std::string &defaultUrl) {
  if (entry.url.empty()) {
    return {defaultUrl, entry.body};
  }
  return {entry.url, entry.body};
}

RequestCorpus RequestCorpus::fromJson(const nlohmann::json &document) {
  if (!document.is_array()) {
    throw ValidationException(ErrorCode::CORPUS_FORMAT_ERROR,
                              "Request corpus must be a JSON array",
                              "corpus", document.type_name());
  }

  bool allStrings = true;
  bool allPairs = true;
  for (const auto &item : document) {
    allStrings = allStrings && item.is_string();

    bool validPair = item.is_array() && !item.empty();
    if (validPair) {
      for (const auto &field : item) {
        validPair = validPair && field.is_string();
      }
    }
    allPairs = allPairs && validPair;
  }

  std::vector<CorpusEntry> entries;
  entries.reserve(document.size());

  // An empty array matches both shapes and yields an empty corpus. Fields
  // past the second one are ignored.
  if (allPairs) {
    for (const auto &item : document) {
      if (item.size() == 1) {
        entries.push_back({"", item[0].get<std::string>()});
      } else {
        entries.push_back(
            {item[0].get<std::string>(), item[1].get<std::string>()});
      }
    }
  } else if (allStrings) {
    for (const auto &item : document) {
      entries.push_back({"", item.get<std::string>()});
    }
  } else {
    throw ValidationException(
        ErrorCode::CORPUS_FORMAT_ERROR,
        "Request corpus entries must all be strings or all be "
        "[url, body] string arrays",
        "corpus");
  }

  return RequestCorpus(std::move(entries));
}

RequestCorpus RequestCorpus::loadFromFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    CORPUS_LOG_WARN("Unable to read request corpus {}; using the default URL "
                    "with empty bodies",
                    path);
    return RequestCorpus();
  }

  try {
    nlohmann::json document;
    file >> document;
    RequestCorpus corpus = fromJson(document);
    CORPUS_LOG_INFO("Loaded {} request entries from {}", corpus.size(), path);
    return corpus;
  } catch (const nlohmann::json::exception &e) {
    CORPUS_LOG_WARN("Request corpus {} is not valid JSON ({}); using the "
                    "default URL with empty bodies",
                    path, e.what());
  } catch (const ValidationException &e) {
    CORPUS_LOG_WARN("Request corpus {} ignored: {}", path, e.getMessage());
  }
  return RequestCorpus();
}

} // namespace httpload
