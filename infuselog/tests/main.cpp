/* InfuseLog unit test runner
 *
 * Copyright (c) 2026 The InfuseLog Team
 *
 * This file is subject to the terms and conditions of the GNU General Public
 * License. See the file COPYING in the main directory of the source code
 * for more details. */

#include <QCoreApplication>

#include "tests/AutoTest.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("InfuseLog");
    QCoreApplication::setApplicationName("infuselog_tests");

    return AutoTest::run(argc, argv);
}
