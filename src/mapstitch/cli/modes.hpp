#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error.
   Configuration and combine errors propagate to main(). */

/* Combine the tiles of one world/zoom into a single image.
   Example:
     mapstitch-cli combine --tiles=./tiles --world=overworld --zoom=2 --grid=512 --crop=auto */
int run_combine(int argc, char** argv);

/* List the worlds found under a tiles directory.
   Example:
     mapstitch-cli worlds --tiles=./tiles */
int run_worlds (int argc, char** argv);

/* Print the effective style as JSON, or save it.
   Example:
     mapstitch-cli style --style=base.json --save=mine.json */
int run_style  (int argc, char** argv);
