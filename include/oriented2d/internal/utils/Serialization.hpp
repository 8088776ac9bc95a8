#pragma once

#ifdef O2D_USE_CEREAL
#include <cereal/cereal.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>
#endif

#include <concepts>
#include <istream>
#include <ostream>
#include <type_traits>

namespace o2d
{

class Writer
{
  public:
    Writer(std::ostream& out) : mOut(out) {}

    template <typename T>
    Writer& write(const T& v) requires std::is_trivially_copyable_v<T>
    {
        mOut.write(reinterpret_cast<const char*>(&v), sizeof(T));
        return *this;
    }

    template <typename T>
    Writer& operator()(const T& v)
    {
        return write(v);
    }

  private:
    std::ostream& mOut;
};

class Reader
{
  public:
    Reader(std::istream& in) : mIn(in) {}

    template <typename T>
    Reader& read(T& v) requires std::is_trivially_copyable_v<T>
    {
        mIn.read(reinterpret_cast<char*>(&v), sizeof(T));
        return *this;
    }

    template <typename T>
    Reader& operator()(T& v)
    {
        return read(v);
    }

    // False once a read ran past the end of the stream
    bool good() const
    {
        return !mIn.fail();
    }

  private:
    std::istream& mIn;
};

#ifdef O2D_USE_CEREAL
template <typename T>
concept IsCerealArchive =
    std::derived_from<T, cereal::detail::OutputArchiveBase> || std::derived_from<T, cereal::detail::InputArchiveBase>;
#endif

} // namespace o2d
