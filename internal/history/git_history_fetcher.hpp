#pragma once

#include <optional>

#include "internal/history/history_fetcher.hpp"

namespace dataguard::history {

/*
  Historical versions via `git show <revision>:<path>`.

  repository_root may be empty, in which case it is discovered from the
  file's directory with `git rev-parse --show-toplevel`.
*/
class GitHistoryFetcher final : public HistoryFetcher {
 public:
  GitHistoryFetcher(std::filesystem::path repository_root, std::string revision);

  FetchResult Fetch(const std::filesystem::path& path) override;

 private:
  FetchResult                          FetchFromGit(const std::filesystem::path& path) const;
  std::optional<std::filesystem::path> ResolveRoot(const std::filesystem::path& file) const;

  std::filesystem::path repository_root_;
  std::string           revision_;
};

} // namespace dataguard::history
