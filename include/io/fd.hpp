#pragma once

namespace migfetch {

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

    // Hands the descriptor over to the caller without closing it.
    int Release();

    void Reset(int fd);
    void Close();

  private:
    int fd_{-1};
};

} // namespace migfetch
