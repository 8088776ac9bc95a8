#pragma once

#include <oriented2d/AABB.hpp>
#include <oriented2d/Matrix2.hpp>
#include <oriented2d/OrientedRectangle.hpp>
#include <oriented2d/internal/utils/Debug.hpp>
#include <oriented2d/internal/utils/Serialization.hpp>

#include <tsl/robin_map.h>
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <set>
#include <utility>
#include <vector>

namespace o2d
{

template <typename T>
concept IsRegistryId = std::totally_ordered<T> && std::is_trivially_copyable_v<T> && requires(const T& id) {
    { std::hash<T>{}(id) } -> std::convertible_to<std::size_t>;
};

// Id-keyed set of oriented rectangles. Queries prune with the cached bounding boxes
// and confirm with the separating axis test.
template <IsRegistryId Id>
class Registry
{
  public:
    Registry() = default;

    void add(Id id, const OrientedRectangle& rectangle);
    void update(Id id, const OrientedRectangle& rectangle);
    void transform(Id id, const Matrix2& matrix);
    void remove(Id id);

    bool contains(Id id) const;
    std::optional<OrientedRectangle> find(Id id) const;

    std::set<Id> query(const OrientedRectangle& rectangle) const;
    std::set<Id> query(const AABB& aabb) const;
    bool areOverlapping(Id a, Id b) const;
    // Every overlapping pair once, smaller id first, sorted
    std::vector<std::pair<Id, Id>> getOverlappingPairs() const;

    std::size_t size() const;
    void clear();

    void serialize(std::ostream& out) const;
    // Stops at the end of the stream; truncated data asserts in debug builds
    static Registry deserialize(std::istream& in);

#ifdef O2D_USE_CEREAL
    template <IsCerealArchive Archive>
    void save(Archive& archive) const;

    template <IsCerealArchive Archive>
    void load(Archive& archive);
#endif

    // Used for testing equality
    bool operator==(const Registry& other) const;

    bool operator!=(const Registry& other) const
    {
        return !(*this == other);
    }

  private:
    struct Entry
    {
        OrientedRectangle mRectangle;
        AABB mBoundingBox;

        explicit Entry(const OrientedRectangle& rectangle)
            : mRectangle(rectangle), mBoundingBox(rectangle.boundingBox())
        {
        }
    };

    // Upper bound on the capacity reserved from an untrusted size prefix
    static constexpr std::size_t MaxDeserializeReserve = 1 << 16;

    tsl::robin_map<Id, Entry> mEntries;

    std::vector<std::pair<Id, const Entry*>> sortedEntries() const;
};

template <IsRegistryId Id>
void Registry<Id>::add(Id id, const OrientedRectangle& rectangle)
{
    O2D_DEBUG_ASSERT(mEntries.find(id) == mEntries.end(), "Rectangle with this ID already exists");
    mEntries.emplace(id, Entry{rectangle});
}

template <IsRegistryId Id>
void Registry<Id>::update(Id id, const OrientedRectangle& rectangle)
{
    auto it = mEntries.find(id);
    O2D_DEBUG_ASSERT(it != mEntries.end(), "Rectangle with this ID does not exist");
    if (it == mEntries.end())
        return;

    it.value() = Entry{rectangle};
}

template <IsRegistryId Id>
void Registry<Id>::transform(Id id, const Matrix2& matrix)
{
    auto it = mEntries.find(id);
    O2D_DEBUG_ASSERT(it != mEntries.end(), "Rectangle with this ID does not exist");
    if (it == mEntries.end())
        return;

    it.value() = Entry{it->second.mRectangle.transformed(matrix)};
}

template <IsRegistryId Id>
void Registry<Id>::remove(Id id)
{
    [[maybe_unused]] const auto erased = mEntries.erase(id);
    O2D_DEBUG_ASSERT(erased == 1, "Rectangle with this ID does not exist");
}

template <IsRegistryId Id>
bool Registry<Id>::contains(Id id) const
{
    return mEntries.find(id) != mEntries.end();
}

template <IsRegistryId Id>
std::optional<OrientedRectangle> Registry<Id>::find(Id id) const
{
    const auto it = mEntries.find(id);
    if (it == mEntries.end())
        return std::nullopt;
    return it->second.mRectangle;
}

template <IsRegistryId Id>
std::set<Id> Registry<Id>::query(const OrientedRectangle& rectangle) const
{
    const AABB queryBox = rectangle.boundingBox();

    std::set<Id> result;
    for (const auto& [id, entry] : mEntries)
    {
        if (!queryBox.intersects(entry.mBoundingBox))
            continue;
        if (intersects(rectangle, entry.mRectangle))
            result.insert(id);
    }
    return result;
}

template <IsRegistryId Id>
std::set<Id> Registry<Id>::query(const AABB& aabb) const
{
    return query(OrientedRectangle::fromAABB(aabb));
}

template <IsRegistryId Id>
bool Registry<Id>::areOverlapping(Id a, Id b) const
{
    const auto itA = mEntries.find(a);
    const auto itB = mEntries.find(b);
    O2D_DEBUG_ASSERT(itA != mEntries.end() && itB != mEntries.end(), "Rectangle with this ID does not exist");
    if (itA == mEntries.end() || itB == mEntries.end())
        return false;

    if (!itA->second.mBoundingBox.intersects(itB->second.mBoundingBox))
        return false;
    return intersects(itA->second.mRectangle, itB->second.mRectangle);
}

template <IsRegistryId Id>
std::vector<std::pair<Id, Id>> Registry<Id>::getOverlappingPairs() const
{
    const auto entries = sortedEntries();

    std::vector<std::pair<Id, Id>> pairs;
    for (std::size_t i = 0; i < entries.size(); ++i)
    {
        const auto& [idA, entryA] = entries[i];
        for (std::size_t j = i + 1; j < entries.size(); ++j)
        {
            const auto& [idB, entryB] = entries[j];
            if (!entryA->mBoundingBox.intersects(entryB->mBoundingBox))
                continue;
            if (intersects(entryA->mRectangle, entryB->mRectangle))
                pairs.emplace_back(idA, idB);
        }
    }
    return pairs;
}

template <IsRegistryId Id>
std::size_t Registry<Id>::size() const
{
    return mEntries.size();
}

template <IsRegistryId Id>
void Registry<Id>::clear()
{
    mEntries.clear();
}

template <IsRegistryId Id>
auto Registry<Id>::sortedEntries() const -> std::vector<std::pair<Id, const Entry*>>
{
    std::vector<std::pair<Id, const Entry*>> entries;
    entries.reserve(mEntries.size());
    for (const auto& [id, entry] : mEntries)
        entries.emplace_back(id, &entry);

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    return entries;
}

template <IsRegistryId Id>
void Registry<Id>::serialize(std::ostream& out) const
{
    Writer writer(out);

    const std::size_t entriesSize = mEntries.size();
    writer(entriesSize);

    // Sorted so equal registries produce equal bytes
    for (const auto& [id, entry] : sortedEntries())
    {
        writer(id);
        entry->mRectangle.serialize(out);
    }
}

template <IsRegistryId Id>
Registry<Id> Registry<Id>::deserialize(std::istream& in)
{
    Reader reader(in);
    Registry<Id> registry;

    std::size_t entriesSize = 0;
    reader(entriesSize);

    registry.mEntries.reserve(std::min(entriesSize, MaxDeserializeReserve));
    for (std::size_t i = 0; i < entriesSize && reader.good(); ++i)
    {
        Id id{};
        reader(id);
        const auto rectangle = OrientedRectangle::deserialize(in);
        if (!reader.good())
            break;
        registry.mEntries.emplace(id, Entry{rectangle});
    }

    O2D_DEBUG_ASSERT(registry.size() == entriesSize, "Truncated Registry data");
    return registry;
}

#ifdef O2D_USE_CEREAL
template <IsRegistryId Id>
template <IsCerealArchive Archive>
void Registry<Id>::save(Archive& archive) const
{
    std::vector<std::pair<Id, OrientedRectangle>> rectangles;
    rectangles.reserve(mEntries.size());
    for (const auto& [id, entry] : sortedEntries())
        rectangles.emplace_back(id, entry->mRectangle);

    archive(rectangles);
}

template <IsRegistryId Id>
template <IsCerealArchive Archive>
void Registry<Id>::load(Archive& archive)
{
    std::vector<std::pair<Id, OrientedRectangle>> rectangles;
    archive(rectangles);

    mEntries.clear();
    mEntries.reserve(rectangles.size());
    for (const auto& [id, rectangle] : rectangles)
        mEntries.emplace(id, Entry{rectangle});
}
#endif

template <IsRegistryId Id>
bool Registry<Id>::operator==(const Registry& other) const
{
    if (mEntries.size() != other.mEntries.size())
        return false;

    for (const auto& [id, entry] : mEntries)
    {
        const auto it = other.mEntries.find(id);
        if (it == other.mEntries.end())
            return false;
        if (entry.mRectangle != it->second.mRectangle)
            return false;
    }
    return true;
}

} // namespace o2d
