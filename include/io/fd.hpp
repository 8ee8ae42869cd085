#pragma once

namespace ue {

// Owning file descriptor. stdin is never closed.
class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Reset(int fd);
    int Release();

    // Returns 0 or the errno reported by close().
    int Close();

  private:
    int fd_{-1};
};

} // namespace ue
