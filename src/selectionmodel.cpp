#include "selectionmodel.h"
#include "artifactstore.h"

SelectionModel::SelectionModel(const ArtifactStore& store)
    : m_store(store)
{
}

bool SelectionModel::toggle(int index)
{
    if (!m_store.contains(index)) {
        return false;
    }

    auto it = m_selected.find(index);
    if (it != m_selected.end()) {
        m_selected.erase(it);
        return false;
    }

    m_selected.insert(index);
    return true;
}

bool SelectionModel::select(int index)
{
    if (!m_store.contains(index)) {
        return false;
    }
    m_selected.insert(index);
    return true;
}

void SelectionModel::selectAll()
{
    for (int index : m_store.indices()) {
        m_selected.insert(index);
    }
}

void SelectionModel::deselectAll()
{
    m_selected.clear();
}

bool SelectionModel::contains(int index) const
{
    return m_selected.find(index) != m_selected.end();
}

QList<int> SelectionModel::selectedIndices() const
{
    QList<int> indices;
    indices.reserve(count());
    for (int index : m_selected) {
        indices.append(index);
    }
    return indices;
}
