module;
#include <QSet>
#include <QString>
#include <QStringList>

module tondar.core.selectionset;

SelectionSet::SelectionSet(QObject* parent) : QObject(parent) {}

void SelectionSet::toggle(const QString& id)
{
    if (id.isEmpty()) return;
    if (!m_ids.remove(id)) m_ids.insert(id);
    emit changed();
}

void SelectionSet::toggleAll(const QStringList& viewIds)
{
    if (m_ids.size() == viewIds.size()) {
        if (m_ids.isEmpty()) return;
        m_ids.clear();
    } else {
        m_ids = QSet<QString>(viewIds.begin(), viewIds.end());
    }
    emit changed();
}

QStringList SelectionSet::ids() const
{
    QStringList out(m_ids.begin(), m_ids.end());
    out.sort();
    return out;
}

void SelectionSet::clear()
{
    if (m_ids.isEmpty()) return;
    m_ids.clear();
    emit changed();
}

void SelectionSet::retainOnly(const QStringList& visibleIds)
{
    const QSet<QString> visible(visibleIds.begin(), visibleIds.end());
    const qsizetype before = m_ids.size();
    m_ids.intersect(visible);
    if (m_ids.size() != before) emit changed();
}
