#pragma once

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <highfive/highfive.hpp>

#include "cobra/branch/continuation_object.hpp"

namespace cobra::io {

// Writes continuation branches to an HDF5 file, one group per branch under
// "branches/". Eigenvalues are stored as (n_points, k, 2) with NaN padding
// when points carry different counts.
class BranchFileWriter {
public:
    enum class Mode : std::uint8_t { kWrite, kAppend };

    explicit BranchFileWriter(std::filesystem::path filename,
                              Mode mode = Mode::kWrite);
    ~BranchFileWriter()                                  = default;
    BranchFileWriter(const BranchFileWriter&)            = delete;
    BranchFileWriter& operator=(const BranchFileWriter&) = delete;
    BranchFileWriter(BranchFileWriter&&)                 = delete;
    BranchFileWriter& operator=(BranchFileWriter&&)      = delete;

    // Throws std::runtime_error when a branch of that name already exists
    // in the file.
    void write_branch(const branch::ContinuationObject& branch);

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return m_filepath;
    }

private:
    std::filesystem::path m_filepath;
    Mode m_mode;
    bool m_opened{false};
    inline static std::mutex m_hdf5_mutex;

    HighFive::File open_file();
    static HighFive::Group open_branches_group(HighFive::File& file);
};

[[nodiscard]] std::vector<std::string>
list_branch_file(const std::filesystem::path& filename);

// Reads back a branch written by BranchFileWriter. Resume seeds, the
// homoclinic context and upoldp are not exported.
[[nodiscard]] branch::ContinuationObject
read_branch_file(const std::filesystem::path& filename, std::string_view name);

} // namespace cobra::io
