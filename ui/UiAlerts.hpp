#pragma once

#include <QMessageBox>
#include <QStringList>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::WindowModal);

// Modal box with custom button labels. Returns the index of the clicked
// button, -1 when closed without one. Empty buttons means a single OK.
int choose(QWidget *parent, QMessageBox::Icon icon, const QString &title,
           const QString &text, const QString &informative,
           const QStringList &buttons, int defaultIndex = 0);

} // namespace UiAlerts
