#ifndef SOURCER_LOADER_H
#define SOURCER_LOADER_H

#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <utility>

namespace sourcer {

// Loads a resolved script. The returned status is the script's own.
class Loader {
public:
    virtual ~Loader() = default;

    [[nodiscard]] virtual int load(
        const std::filesystem::path& path,
        std::span<const std::string> args) = 0;
};

class ExecLoader : public Loader {
public:
    [[nodiscard]] explicit ExecLoader(std::string interpreter)
    : m_interpreter{std::move(interpreter)} {}

    [[nodiscard]] int load(
        const std::filesystem::path& path,
        std::span<const std::string> args) override;

private:
    std::string m_interpreter;
};

// Prints the path so the calling shell can `builtin source` it itself.
class PrintLoader : public Loader {
public:
    [[nodiscard]] explicit PrintLoader(std::FILE* stream = stdout)
    : m_stream{stream} {}

    [[nodiscard]] int load(
        const std::filesystem::path& path,
        std::span<const std::string> args) override;

private:
    std::FILE* m_stream;
};

} // namespace sourcer

#endif
