#ifndef MELT_NIX_SERVICE_HPP
#define MELT_NIX_SERVICE_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "errors.hpp"
#include "flake.hpp"
#include "thread_utils.hpp"

namespace melt {

/**
 * @brief Operations on a flake performed through the `nix` command.
 */
class NixOperations {
  public:
    virtual ~NixOperations() = default;

    /** Read inputs and lock data of the flake at @p path. */
    virtual std::optional<FlakeData> load_metadata(const std::filesystem::path& path,
                                                   Error* error = nullptr) = 0;
    /** Refresh the given inputs to their latest upstream revisions. */
    virtual bool update_inputs(const std::filesystem::path& path,
                               const std::vector<std::string>& names, Error* error = nullptr) = 0;
    virtual bool update_all(const std::filesystem::path& path, Error* error = nullptr) = 0;
    /** Pin input @p name to the flake reference @p locator. */
    virtual bool lock_input(const std::filesystem::path& path, const std::string& name,
                            const std::string& locator, Error* error = nullptr) = 0;
};

/**
 * @brief Turn a user supplied location into the flake directory.
 *
 * `.` and the empty path mean the working directory. A trailing `flake.nix`
 * is stripped. The result is canonical and contains a `flake.nix`.
 *
 * @param error Receives ErrorKind::FlakeNotFound.
 */
std::optional<std::filesystem::path> resolve_flake_path(const std::filesystem::path& path,
                                                        Error* error = nullptr);

/**
 * @brief Decode the output of `nix flake metadata --json`.
 *
 * Only direct inputs of the root node are listed. Inputs that follow another
 * node are resolved through the first element of the follows path.
 *
 * @param error Receives ErrorKind::Parse for malformed JSON.
 */
std::optional<FlakeData> parse_metadata(const std::filesystem::path& flake_dir,
                                        const std::string& json_text, Error* error = nullptr);

class NixService : public NixOperations {
  public:
    explicit NixService(CancellationToken cancel,
                        std::chrono::milliseconds timeout = std::chrono::seconds(120));

    std::optional<FlakeData> load_metadata(const std::filesystem::path& path,
                                           Error* error = nullptr) override;
    bool update_inputs(const std::filesystem::path& path, const std::vector<std::string>& names,
                       Error* error = nullptr) override;
    bool update_all(const std::filesystem::path& path, Error* error = nullptr) override;
    bool lock_input(const std::filesystem::path& path, const std::string& name,
                    const std::string& locator, Error* error = nullptr) override;

  private:
    std::optional<std::string> run_nix(const std::vector<std::string>& args, Error* error);

    CancellationToken cancel_;
    std::chrono::milliseconds timeout_;
};

} // namespace melt

#endif // MELT_NIX_SERVICE_HPP
