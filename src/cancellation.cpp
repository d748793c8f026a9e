#include "cancellation.h"

namespace tvremote {

CancellationToken::CancellationToken(QObject *parent)
    : QObject(parent)
{
}

CancellationToken *CancellationToken::createChild(QObject *parent) const
{
    auto *child = new CancellationToken(parent);
    if (m_cancelled) {
        child->m_cancelled = true;
        return child;
    }
    QObject::connect(this, &CancellationToken::cancelled, child, &CancellationToken::cancel);
    return child;
}

void CancellationToken::cancel()
{
    if (m_cancelled)
        return;
    m_cancelled = true;
    emit cancelled();
}

} // namespace tvremote
