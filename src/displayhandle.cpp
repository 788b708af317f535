#include "displayhandle.h"
#include <QDebug>

PreviewHandleProvider::PreviewHandleProvider()
    : m_nextId(1)
{
}

PreviewHandleProvider::~PreviewHandleProvider()
{
    if (!m_previews.isEmpty()) {
        qWarning() << "PreviewHandleProvider:" << m_previews.size() << "handles were never released";
    }
}

DisplayHandle PreviewHandleProvider::create(const QByteArray& payload)
{
    QImage image;
    if (!image.loadFromData(payload)) {
        qWarning() << "PreviewHandleProvider: payload of" << payload.size() << "bytes is not a readable image";
    }

    DisplayHandle handle(m_nextId++);
    m_previews.insert(handle.id, image);
    return handle;
}

void PreviewHandleProvider::release(const DisplayHandle& handle)
{
    if (m_previews.remove(handle.id) == 0) {
        qWarning() << "PreviewHandleProvider: release of unknown handle" << handle.id;
    }
}

QImage PreviewHandleProvider::preview(const DisplayHandle& handle) const
{
    return m_previews.value(handle.id);
}
