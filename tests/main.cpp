#include <QLoggingCategory>
#include <CppUTest/CommandLineTestRunner.h>
#include <CppUTest/MemoryLeakWarningPlugin.h>

int main(int argc, char** argv) {
    // Реестр категорий Qt и статические буферы живут до конца процесса,
    // детектор утечек CppUTest принимает их за утечки.
    MemoryLeakWarningPlugin::turnOffNewDeleteOverloads();
    QLoggingCategory::setFilterRules(qEnvironmentVariableIsSet("CCIDGADGET_TEST_LOG")
                                         ? "ccidgadget.*=true" : "ccidgadget.*=false");
    return CommandLineTestRunner::RunAllTests(argc, argv);
}
