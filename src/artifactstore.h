#ifndef ARTIFACTSTORE_H
#define ARTIFACTSTORE_H

#include <QByteArray>
#include <QList>
#include <map>
#include <optional>
#include "displayhandle.h"

struct SliceArtifact {
    int index;
    QByteArray payload;
    int width;
    int height;
    DisplayHandle displayHandle;

    SliceArtifact() :
        index(-1),
        width(0),
        height(0)
    {}
};

/**
 * Owner of the slice artifacts of the current session
 *
 * Every artifact gets a display handle when it is stored. releaseAll() is the
 * only way artifacts leave the store and it releases each handle before the
 * artifact is dropped.
 */
class ArtifactStore
{
public:
    /**
     * @param handles Provider used to create and release display handles (must outlive the store)
     */
    explicit ArtifactStore(DisplayHandleProvider& handles);
    ~ArtifactStore();

    ArtifactStore(const ArtifactStore&) = delete;
    ArtifactStore& operator=(const ArtifactStore&) = delete;

    /**
     * Store an artifact and create its display handle.
     * An index that is already stored keeps its artifact and handle.
     * @param index 0-based slice index
     * @param payload Encoded slice bytes
     * @param width Slice width in pixels
     * @param height Slice height in pixels
     * @return The stored artifact for the index
     */
    SliceArtifact put(int index, const QByteArray& payload, int width, int height);

    /**
     * Get artifact by index
     * @param index Slice index
     * @return Artifact, or std::nullopt if not stored
     */
    std::optional<SliceArtifact> get(int index) const;

    bool contains(int index) const;

    /**
     * Get all artifacts in ascending index order
     */
    QList<SliceArtifact> all() const;

    /**
     * Get all stored indices in ascending order
     */
    QList<int> indices() const;

    int size() const { return static_cast<int>(m_artifacts.size()); }
    bool isEmpty() const { return m_artifacts.empty(); }

    /**
     * Check that the stored indices are exactly 0..size()-1
     */
    bool isContiguous() const;

    /**
     * Release every display handle, then drop all artifacts
     * Safe to call on an empty store and any number of times.
     * @return Number of handles released
     */
    int releaseAll();

private:
    DisplayHandleProvider& m_handles;
    std::map<int, SliceArtifact> m_artifacts;
};

#endif // ARTIFACTSTORE_H
