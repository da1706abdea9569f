#include "deskkit/ui/FindReplaceDialog.hpp"

#include "deskkit/logging/Logger.hpp"

#include <QCheckBox>
#include <QGridLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QVBoxLayout>

namespace deskkit::ui {

FindReplaceDialog::FindReplaceDialog(QWidget* parent) : QDialog(parent) {
  setWindowTitle(QStringLiteral("Find and Replace"));
  setModal(false);

  auto* layout = new QVBoxLayout(this);
  layout->setContentsMargins(12, 12, 12, 12);
  layout->setSpacing(8);

  auto* fields = new QGridLayout();
  fields->addWidget(new QLabel(QStringLiteral("Find:"), this), 0, 0);
  m_findText = new QLineEdit(this);
  m_findText->setObjectName(QStringLiteral("findText"));
  fields->addWidget(m_findText, 0, 1);
  fields->addWidget(new QLabel(QStringLiteral("Replace with:"), this), 1, 0);
  m_replaceText = new QLineEdit(this);
  m_replaceText->setObjectName(QStringLiteral("replaceText"));
  fields->addWidget(m_replaceText, 1, 1);
  layout->addLayout(fields);

  auto* optionsRow = new QHBoxLayout();
  m_caseSensitive  = new QCheckBox(QStringLiteral("Match case"), this);
  m_wholeWord      = new QCheckBox(QStringLiteral("Whole word"), this);
  optionsRow->addWidget(m_caseSensitive);
  optionsRow->addWidget(m_wholeWord);
  optionsRow->addStretch();
  layout->addLayout(optionsRow);

  auto* buttons     = new QHBoxLayout();
  m_findButton      = new QPushButton(QStringLiteral("Find Next"), this);
  m_previousButton  = new QPushButton(QStringLiteral("Find Previous"), this);
  m_replaceButton   = new QPushButton(QStringLiteral("Replace All"), this);
  auto* closeButton = new QPushButton(QStringLiteral("Close"), this);
  m_findButton->setDefault(true);
  buttons->addWidget(m_findButton);
  buttons->addWidget(m_previousButton);
  buttons->addWidget(m_replaceButton);
  buttons->addStretch();
  buttons->addWidget(closeButton);
  layout->addLayout(buttons);

  m_status = new QLabel(this);
  m_status->setObjectName(QStringLiteral("searchStatus"));
  layout->addWidget(m_status);

  connect(m_findButton, &QPushButton::clicked, this, &FindReplaceDialog::findNext);
  connect(m_previousButton, &QPushButton::clicked, this, &FindReplaceDialog::findPrevious);
  connect(m_replaceButton, &QPushButton::clicked, this, [this]() { replaceAll(); });
  connect(closeButton, &QPushButton::clicked, this, &FindReplaceDialog::close);
  connect(m_findText, &QLineEdit::returnPressed, this, &FindReplaceDialog::findNext);
  connect(m_findText, &QLineEdit::textChanged, this, &FindReplaceDialog::updateControls);

  updateControls();
  updateStatus();
}

void FindReplaceDialog::setSearch(data::GridSearch* search) {
  if (m_search == search) {
    return;
  }
  if (m_search) {
    disconnect(m_matchesConnection);
    m_search->clear();
  }

  m_search = search;
  if (m_search) {
    m_matchesConnection =
        connect(m_search.data(), &data::GridSearch::matchesChanged, this, &FindReplaceDialog::updateStatus);
  }
  updateControls();
  updateStatus();
}

data::GridSearch* FindReplaceDialog::search() const noexcept {
  return m_search.data();
}

void FindReplaceDialog::setFindText(const QString& text) {
  m_findText->setText(text);
}

void FindReplaceDialog::setReplaceText(const QString& text) {
  m_replaceText->setText(text);
}

void FindReplaceDialog::setCaseSensitive(bool enabled) {
  m_caseSensitive->setChecked(enabled);
}

void FindReplaceDialog::setWholeWord(bool enabled) {
  m_wholeWord->setChecked(enabled);
}

data::SearchOptions FindReplaceDialog::options() const {
  data::SearchOptions options;
  options.caseSensitive = m_caseSensitive->isChecked();
  options.wholeWord     = m_wholeWord->isChecked();
  return options;
}

QString FindReplaceDialog::statusText() const {
  return m_status->text();
}

void FindReplaceDialog::findNext() {
  if (!m_search || m_findText->text().isEmpty()) {
    return;
  }
  if (searchIsCurrent()) {
    m_search->findNext();
  } else {
    m_searchedOptions = options();
    m_search->findAll(m_findText->text(), m_searchedOptions);
  }
  updateStatus();
}

void FindReplaceDialog::findPrevious() {
  if (!m_search || m_findText->text().isEmpty()) {
    return;
  }
  if (!searchIsCurrent()) {
    m_searchedOptions = options();
    m_search->findAll(m_findText->text(), m_searchedOptions);
  }
  m_search->findPrevious();
  updateStatus();
}

int FindReplaceDialog::replaceAll() {
  if (!m_search || m_findText->text().isEmpty()) {
    return 0;
  }
  const int replaced = m_search->replaceAll(m_findText->text(), m_replaceText->text(), options());
  LOG_CAT(logging::LogLevel::Info, QStringLiteral("Search"),
          QStringLiteral("Replaced '%1' in %2 cells").arg(m_findText->text()).arg(replaced));
  m_status->setText(QStringLiteral("Replaced %1 cells").arg(replaced));
  return replaced;
}

void FindReplaceDialog::reject() {
  if (m_search) {
    m_search->clear();
  }
  QDialog::reject();
}

bool FindReplaceDialog::searchIsCurrent() const {
  const data::SearchOptions current = options();
  return m_search->matchCount() > 0 && m_search->searchText() == m_findText->text() &&
         current.caseSensitive == m_searchedOptions.caseSensitive && current.wholeWord == m_searchedOptions.wholeWord;
}

void FindReplaceDialog::updateControls() {
  const bool usable = m_search && !m_findText->text().isEmpty();
  m_findButton->setEnabled(usable);
  m_previousButton->setEnabled(usable);
  m_replaceButton->setEnabled(usable && m_search->canReplace());
}

void FindReplaceDialog::updateStatus() {
  if (!m_search) {
    m_status->setText(QStringLiteral("No table selected"));
    return;
  }
  m_status->setText(m_search->statusText());
}

}  // namespace deskkit::ui
