// Classify track end points by TPC region and optionally shift them by a t0.
//
//   $ matcha-trackpoint -v 0.157 -t 12.5 points.json -o shifted.json
//
// The input is a JSON array of objects with track_id, position and
// direction.  The output is the same array with positions shifted and with
// region and drift_direction filled.

#include "MatchaApps/TrackPointCli.h"

int main(int argc, char* argv[])
{
    return Matcha::Apps::trackpoint_cli(argc, argv);
}
