#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace receiver
{

// Where finalized files go. write_file returns false and fills `err` on failure.
struct IFileSink
{
    virtual bool write_file(const std::string               &name,
                            const std::vector<std::uint8_t> &bytes,
                            std::string                     &err) = 0;
    virtual ~IFileSink()                                          = default;
};

// Writes into one directory through a temp file renamed over the final name.
class DirectorySink final : public IFileSink
{
  public:
    explicit DirectorySink(std::string dir) : dir_(std::move(dir)) {}

    bool write_file(const std::string               &name,
                    const std::vector<std::uint8_t> &bytes,
                    std::string                     &err) override;

    const std::string &dir() const { return dir_; }

  private:
    std::string dir_;
};

// Reduce a header-supplied name to something safe to create inside a directory.
// Empty result means the name is unusable.
std::string safe_file_name(const std::string &name);

}  // namespace receiver
