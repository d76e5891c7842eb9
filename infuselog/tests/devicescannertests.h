/* Device Scanner Unit Tests
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#ifndef DEVICESCANNERTESTS_H
#define DEVICESCANNERTESTS_H

#include "AutoTest.h"

class DeviceScannerTests : public QObject
{
    Q_OBJECT

private slots:
    void testFindsDeviceOnLaterPoll();
    void testDetectionError();
    void testTimeout();
    void testStopScanning();
};

DECLARE_TEST(DeviceScannerTests)

#endif // DEVICESCANNERTESTS_H
