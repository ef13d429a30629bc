#include "internal/history/git_history_fetcher.hpp"

#include <arrow/buffer.h>

#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"

namespace dataguard::history {

using dataguard::util::CaptureCommand;
using dataguard::util::ShellQuote;

GitHistoryFetcher::GitHistoryFetcher(std::filesystem::path repository_root, std::string revision)
    : repository_root_(std::move(repository_root)), revision_(std::move(revision)) {}

std::optional<std::filesystem::path> GitHistoryFetcher::ResolveRoot(const std::filesystem::path& file) const {
  if (!repository_root_.empty()) {
    return std::filesystem::absolute(repository_root_).lexically_normal();
  }

  auto directory = file.parent_path();
  if (directory.empty()) directory = ".";

  auto result = CaptureCommand("git -C " + ShellQuote(directory.string()) + " rev-parse --show-toplevel");
  if (!result.ok()) {
    return std::nullopt;
  }

  auto root = result.output;
  while (!root.empty() && (root.back() == '\n' || root.back() == '\r')) root.pop_back();
  if (root.empty()) {
    return std::nullopt;
  }
  return std::filesystem::path(root);
}

FetchResult GitHistoryFetcher::Fetch(const std::filesystem::path& path) {
  try {
    return FetchFromGit(path);
  } catch (const util::CommandError& e) {
    return FetchResult::Failed(std::string("git unavailable: ") + e.what());
  }
}

FetchResult GitHistoryFetcher::FetchFromGit(const std::filesystem::path& path) const {
  std::error_code ec;
  auto absolute = std::filesystem::absolute(path, ec);
  if (ec) {
    return FetchResult::Failed("cannot resolve path: " + ec.message());
  }
  absolute = absolute.lexically_normal();

  auto root = ResolveRoot(absolute);
  if (!root) {
    return FetchResult::Failed("not inside a git repository");
  }

  // symlinked checkouts (e.g. /tmp on macOS) need the weak canonical form
  std::error_code file_ec;
  std::error_code root_ec;
  const auto      canonical_file = std::filesystem::weakly_canonical(absolute, file_ec);
  const auto      canonical_root = std::filesystem::weakly_canonical(*root, root_ec);

  std::filesystem::path relative;
  if (!file_ec && !root_ec) {
    relative = canonical_file.lexically_relative(canonical_root);
  }
  if (relative.empty() || *relative.begin() == "..") {
    relative = absolute.lexically_relative(*root);
  }
  if (relative.empty() || *relative.begin() == "..") {
    return FetchResult::Failed("path is outside repository " + root->string());
  }

  // git wants forward slashes relative to the top level
  const auto object = revision_ + ":" + relative.generic_string();
  auto result = CaptureCommand("git -C " + ShellQuote(root->string()) + " show " + ShellQuote(object));

  if (!result.ok()) {
    return FetchResult::NotFound("git show " + object + " exited with status " + std::to_string(result.exit_code));
  }
  if (result.output.empty()) {
    return FetchResult::NotFound("git show " + object + " returned no content");
  }

  return FetchResult::Found(arrow::Buffer::FromString(std::move(result.output)));
}

} // namespace dataguard::history
