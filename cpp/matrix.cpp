/**
 * DO NOT REMOVE COPYRIGHT NOTICES OR THIS HEADER.
 *
 * Contributor(s):
 *
 * The Original Software is RateStrap.
 * The Initial Developer of the Original Software is REDUKTI LIMITED (http://redukti.com).
 *
 * Copyright 2017-2019 REDUKTI LIMITED. All Rights Reserved.
 *
 * The contents of this file are subject to the the GNU General Public License
 * Version 3 (https://www.gnu.org/licenses/gpl.txt).
 */

#include <matrix.h>

void ratestrap_matrix_dump_to(const ratestrap_matrix_t *A, const char *desc, FILE *file)
{
	fprintf(file, "%s (%d x %d)\n", desc, (int)A->m, (int)A->n);
	for (int32_t i = 0; i < A->m; i++) {
		fputs("[", file);
		for (int32_t j = 0; j < A->n; j++) {
			if (j > 0)
				fputs(", ", file);
			fprintf(file, "% .9e", ratestrap_matrix_get(A, i, j));
		}
		fputs("]\n", file);
	}
}
