#include "artifactstore.h"
#include <QDebug>

ArtifactStore::ArtifactStore(DisplayHandleProvider& handles)
    : m_handles(handles)
{
}

ArtifactStore::~ArtifactStore()
{
    releaseAll();
}

SliceArtifact ArtifactStore::put(int index, const QByteArray& payload, int width, int height)
{
    auto existing = m_artifacts.find(index);
    if (existing != m_artifacts.end()) {
        qWarning() << "ArtifactStore: slice" << index << "already stored, keeping the first one";
        return existing->second;
    }

    SliceArtifact artifact;
    artifact.index = index;
    artifact.payload = payload;
    artifact.width = width;
    artifact.height = height;
    artifact.displayHandle = m_handles.create(payload);

    m_artifacts.emplace(index, artifact);
    return artifact;
}

std::optional<SliceArtifact> ArtifactStore::get(int index) const
{
    auto it = m_artifacts.find(index);
    if (it == m_artifacts.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ArtifactStore::contains(int index) const
{
    return m_artifacts.find(index) != m_artifacts.end();
}

QList<SliceArtifact> ArtifactStore::all() const
{
    QList<SliceArtifact> artifacts;
    artifacts.reserve(size());
    for (const auto& entry : m_artifacts) {
        artifacts.append(entry.second);
    }
    return artifacts;
}

QList<int> ArtifactStore::indices() const
{
    QList<int> keys;
    keys.reserve(size());
    for (const auto& entry : m_artifacts) {
        keys.append(entry.first);
    }
    return keys;
}

bool ArtifactStore::isContiguous() const
{
    int expected = 0;
    for (const auto& entry : m_artifacts) {
        if (entry.first != expected) {
            return false;
        }
        ++expected;
    }
    return true;
}

int ArtifactStore::releaseAll()
{
    int released = 0;
    for (auto& entry : m_artifacts) {
        if (entry.second.displayHandle.isValid()) {
            m_handles.release(entry.second.displayHandle);
            entry.second.displayHandle = DisplayHandle();
            ++released;
        }
    }
    m_artifacts.clear();
    return released;
}
