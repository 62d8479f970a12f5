#ifndef MARKPRINT_PAGELAYOUT_H
#define MARKPRINT_PAGELAYOUT_H

#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QSizeF>

struct PageLayout
{
    QPageSize::PageSizeId pageSizeId = QPageSize::A4;
    QPageLayout::Orientation orientation = QPageLayout::Portrait;
    QMarginsF margins{20.0, 20.0, 20.0, 20.0}; // mm

    // Full page size in points (72 dpi)
    QSizeF pageSizePoints() const
    {
        QPageSize ps(pageSizeId);
        QSizeF full = ps.size(QPageSize::Point);
        if (orientation == QPageLayout::Landscape)
            full.transpose();
        return full;
    }

    // Printable area in points
    QSizeF contentSizePoints() const
    {
        constexpr qreal mmToPt = 72.0 / 25.4;
        const QSizeF full = pageSizePoints();
        return QSizeF(full.width() - (margins.left() + margins.right()) * mmToPt,
                      full.height() - (margins.top() + margins.bottom()) * mmToPt);
    }

    QPageLayout toQPageLayout() const
    {
        return QPageLayout(QPageSize(pageSizeId), orientation, margins,
                           QPageLayout::Millimeter);
    }
};

#endif // MARKPRINT_PAGELAYOUT_H
