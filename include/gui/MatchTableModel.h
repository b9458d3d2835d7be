#pragma once

#include <QAbstractTableModel>
#include <vector>

#include "xorhunt/ScanTypes.h"

class MatchTableModel : public QAbstractTableModel {
    Q_OBJECT
public:
    explicit MatchTableModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    int columnCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role = Qt::DisplayRole) const override;
    QVariant headerData(int section, Qt::Orientation orientation, int role = Qt::DisplayRole) const override;

    void setMatches(std::vector<xorhunt::Match> matches, unsigned keyWidth);
    void clear();
    const xorhunt::Match *matchAt(int row) const;

    // Views index rows with int; anything past INT_MAX is not shown.
    static int clampedRows(size_t count);

private:
    std::vector<xorhunt::Match> matches_;
    unsigned keyWidth_{4};
};
