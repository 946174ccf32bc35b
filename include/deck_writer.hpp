#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace vid2slides {

class DeckWriter {
public:
    virtual ~DeckWriter() = default;

    // Writes one full-canvas slide per image, in the given order, and
    // returns the path written. Throws ArtifactError on failure, in which
    // case nothing is left at `output`.
    virtual std::filesystem::path write(const std::vector<std::filesystem::path>& images,
                                        const std::filesystem::path& output,
                                        const std::string& title) = 0;

    virtual std::string extension() const = 0;
};

// 16:9 PowerPoint deck. The Office Open XML parts are staged in a
// temporary directory and packed with the external `zip` tool.
class PptxDeckWriter : public DeckWriter {
public:
    static constexpr long long kSlideWidthEmu = 14630400;  // 16 in
    static constexpr long long kSlideHeightEmu = 8229600;  // 9 in

    explicit PptxDeckWriter(std::string zip_executable = "zip");

    std::filesystem::path write(const std::vector<std::filesystem::path>& images,
                                const std::filesystem::path& output,
                                const std::string& title) override;

    std::string extension() const override { return ".pptx"; }

    // Writes the unpacked package tree for `images` under `dir`
    void stage(const std::vector<std::filesystem::path>& images,
               const std::filesystem::path& dir,
               const std::string& title) const;

private:
    std::string zip_executable_;
};

// Deck location: `<output>/<video_id>.pptx` when output is an existing
// directory (or ends in a separator), `output` itself when it names a
// file, and `<image_dir>/<video_id>.pptx` when no output was given.
std::filesystem::path resolve_deck_path(const std::string& output,
                                        const std::filesystem::path& image_dir,
                                        const std::string& video_id,
                                        const std::string& extension);

} // namespace vid2slides
