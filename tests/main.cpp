#include <iostream>

void run_pegtl_smoke_test();
void run_parser_tests();
void run_value_tests();
void run_shape_tests();
void run_cache_tests();
void run_task_pool_tests();
void run_builtins_tests();
void run_interpreter_tests();
void run_minify_tests();
void run_env_tests();
void run_diagnostics_tests();
void run_examples_smoke();

int main(){
    run_pegtl_smoke_test();
    run_parser_tests();
    run_value_tests();
    run_shape_tests();
    run_cache_tests();
    run_task_pool_tests();
    run_builtins_tests();
    run_interpreter_tests();
    run_minify_tests();
    run_env_tests();
    run_diagnostics_tests();
    run_examples_smoke();
    std::cout << "All tests passed" << std::endl;
    return 0;
}
