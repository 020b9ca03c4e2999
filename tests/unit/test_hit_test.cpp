// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>
#include <QPointF>
#include <QtMath>
#include <cmath>

#include "core/hittest.h"
#include "core/constants.h"

using namespace QuickWheel;

/**
 * @brief Unit tests for HitTest::hitTest()
 *
 * Tests cover:
 * - Dead zone and outside-ring rejection
 * - Slot partition: eight equal 45° arcs, slot 0 centered on the +x axis
 * - Boundary placement half way between slot centers
 * - Settings button priority over the ring
 */
class TestHitTest : public QObject
{
    Q_OBJECT

private:
    static constexpr qreal Inner = 50.0;
    static constexpr qreal Outer = 180.0;

    static WheelGeometry geometry()
    {
        return WheelGeometry::fromRadii(Inner, Outer, 14.0);
    }

    // Offset at @p degrees (screen coordinates, y down) and @p radius from center
    static QPointF polar(qreal degrees, qreal radius)
    {
        const qreal rad = qDegreesToRadians(degrees);
        return QPointF(radius * std::cos(rad), radius * std::sin(rad));
    }

private Q_SLOTS:
    // ═══════════════════════════════════════════════════════════════════════
    // Dead zone / outside
    // ═══════════════════════════════════════════════════════════════════════

    void test_center_isNone()
    {
        QCOMPARE(HitTest::hitTest(QPointF(0, 0), geometry()), HitResult::none());
    }

    void test_insideInnerRadius_isNone()
    {
        for (int deg = 0; deg < 360; deg += 15) {
            QCOMPARE(HitTest::hitTest(polar(deg, Inner - 0.5), geometry()), HitResult::none());
        }
    }

    void test_outsideOuterRadius_isNone()
    {
        // 90° (straight down) is nowhere near the settings button
        QCOMPARE(HitTest::hitTest(polar(90, Outer + 0.5), geometry()), HitResult::none());
        QCOMPARE(HitTest::hitTest(polar(180, Outer * 3), geometry()), HitResult::none());
    }

    void test_ringEdges_areInclusive()
    {
        QCOMPARE(HitTest::hitTest(polar(0, Inner), geometry()), HitResult::forSlot(0));
        QCOMPARE(HitTest::hitTest(polar(0, Outer), geometry()), HitResult::forSlot(0));
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Slot partition
    // ═══════════════════════════════════════════════════════════════════════

    void test_slotCenters_data()
    {
        QTest::addColumn<qreal>("degrees");
        QTest::addColumn<int>("slot");

        for (int i = 0; i < Defaults::SlotCount; ++i) {
            QTest::addRow("slot%d", i) << qreal(i * 45) << i;
        }
    }

    void test_slotCenters()
    {
        QFETCH(qreal, degrees);
        QFETCH(int, slot);
        QCOMPARE(HitTest::hitTest(polar(degrees, 100), geometry()), HitResult::forSlot(slot));
        QCOMPARE(HitTest::slotCenterAngle(slot), degrees);
    }

    void test_slotZero_straddlesPositiveXAxis()
    {
        QCOMPARE(HitTest::hitTest(polar(-22.4, 100), geometry()), HitResult::forSlot(0));
        QCOMPARE(HitTest::hitTest(polar(22.4, 100), geometry()), HitResult::forSlot(0));
        QCOMPARE(HitTest::hitTest(polar(-22.6, 100), geometry()), HitResult::forSlot(7));
        QCOMPARE(HitTest::hitTest(polar(22.6, 100), geometry()), HitResult::forSlot(1));
    }

    void test_everyArcIs45Degrees()
    {
        // Walk the full circle in 0.5° steps; each slot must own exactly 90 steps
        QVector<int> counts(Defaults::SlotCount, 0);
        for (int step = 0; step < 720; ++step) {
            const qreal deg = step * 0.5 + 0.25; // Never exactly on a boundary
            const HitResult hit = HitTest::hitTest(polar(deg, 120), geometry());
            QVERIFY(hit.isSlot());
            ++counts[hit.slot];
        }
        for (int i = 0; i < Defaults::SlotCount; ++i) {
            QCOMPARE(counts[i], 90);
        }
    }

    void test_slotForAngle_normalizesNegativeAndLargeAngles()
    {
        QCOMPARE(HitTest::slotForAngle(-90.0), 6);
        QCOMPARE(HitTest::slotForAngle(270.0), 6);
        QCOMPARE(HitTest::slotForAngle(720.0), 0);
        QCOMPARE(HitTest::slotForAngle(337.6), 0);
        QCOMPARE(HitTest::slotForAngle(337.4), 7);
    }

    // ═══════════════════════════════════════════════════════════════════════
    // Settings button
    // ═══════════════════════════════════════════════════════════════════════

    void test_settingsButton_placedOutsideRingUpperRight()
    {
        const WheelGeometry g = geometry();
        QVERIFY(g.settingsButtonCenter.x() > 0);
        QVERIFY(g.settingsButtonCenter.y() < 0);
        const qreal dist = std::hypot(g.settingsButtonCenter.x(), g.settingsButtonCenter.y());
        QVERIFY(dist - g.settingsButtonRadius > Outer);
    }

    void test_settingsButton_hit()
    {
        const WheelGeometry g = geometry();
        QCOMPARE(HitTest::hitTest(g.settingsButtonCenter, g), HitResult::settingsButton());
        QCOMPARE(HitTest::hitTest(g.settingsButtonCenter + QPointF(g.settingsButtonRadius - 1, 0), g),
                 HitResult::settingsButton());
    }

    void test_settingsButton_hasPriorityOverRing()
    {
        // Pull the button inward so it overlaps the ring
        WheelGeometry g = geometry();
        g.settingsButtonCenter = polar(-45, Outer - 5);
        QCOMPARE(HitTest::hitTest(polar(-45, Outer - 5), g), HitResult::settingsButton());
        // Outside the button the ring still answers
        QCOMPARE(HitTest::hitTest(polar(-45, Inner + 10), g), HitResult::forSlot(7));
    }
};

QTEST_MAIN(TestHitTest)
#include "test_hit_test.moc"
