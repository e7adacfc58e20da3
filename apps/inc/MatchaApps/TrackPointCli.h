#ifndef MATCHA_APPS_TRACKPOINTCLI
#define MATCHA_APPS_TRACKPOINTCLI

namespace Matcha::Apps {

    /** The matcha-trackpoint command line program.

        Read a JSON array of track points, classify each by TPC region and,
        if a t0 is given, shift them along x.  Write the points as JSON.

        Return 0 on success, 1 on a usage error and 2 if the input,
        configuration or shift fails.  Help is printed on "-h".
     */
    int trackpoint_cli(int argc, const char* const argv[]);

}  // namespace Matcha::Apps

#endif
