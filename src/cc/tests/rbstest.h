#ifndef TESTS_RBSTEST
#define TESTS_RBSTEST

#include <gtest/gtest.h>
#include <stdint.h>
#include <sys/stat.h>

#include <string>

namespace RBS {
namespace Test {

using namespace std;

class RBSTestUtils
{
public:
    static const string kTestHome;

    /**
     * Creates a temporary file under kTestHome.
     *
     * @param path Output parameter set to the path of the new temporary file.
     * @return The file descriptor of the temporary file. The caller must
     * close it once finished writing.
     */
    static int CreateTempFile(string* path);

    /**
     * Writes a string to a new temporary file.
     *
     * @param data The string to write to a new file.
     * @return The path of the temporary file.
     */
    static string WriteTempFile(const string& data);

    /**
     * Check if a file exists at the given path.
     *
     * @param path The path to check
     * @param s Optional output parameter to get the stat value of the file
     * @return True if a file exists at the given path
     */
    static bool FileExists(const string& path, struct stat* s = NULL);

    /**
     * Remove a file or directory forcefully, e.g. calling rm -rf on it.
     *
     * @param path The path to remove
     */
    static void RemoveForcefully(const string& path);

    /**
     * Generates deterministic pseudo random test data.
     *
     * @param size The number of bytes to generate
     * @param seed Different seeds produce different data
     */
    static string MakeData(size_t size, uint32_t seed = 1);
};

} // namespace Test
} // namespace RBS

#endif
