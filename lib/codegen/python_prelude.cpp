// syn_dsl/codegen/python_prelude.cpp - Runtime helpers emitted ahead of every pipeline
#include "syn_dsl/codegen/python_generator.hpp"

namespace syn_dsl::codegen
{

namespace
{

// Everything up to the pipeline marker. The helpers are nested in main() so
// that they read the pipeline's settings (model, concurrency, ...) through
// closures at call time.
constexpr std::string_view k_prelude = R"PY(import datasets
from datasets import load_dataset, Dataset, concatenate_datasets
import pandas as pd
import os
import sys
import json
import operator
from openai import AsyncOpenAI
import time
import asyncio
from tqdm import tqdm
import signal


def main():
    debug = os.environ.get('SYN_DEBUG', '0') == '1'

    concurrency = 1
    stream = False
    model = None
    api_key = None
    api_url = None
    output_file = 'output.json'
    fields = []
    filters = {}
    loaded_datasets = {}
    was_saved = False
    prompt_templates = {}
    system_prompts = {}
    shutdown = False
    sigint_handler_registered = False

    OPS = {
        '==': operator.eq,
        '!=': operator.ne,
        '>': operator.gt,
        '<': operator.lt,
        '>=': operator.ge,
        '<=': operator.le,
    }

    # Installed by PRAGMA AUTOSAVE only.
    def signal_handler(sig, frame):
        nonlocal shutdown
        if shutdown:
            return
        print('\nInterrupt received, saving current results...', flush=True)
        shutdown = True
        save_current_results()
        print('Shutting down.', flush=True)
        sys.exit(0)

    def save_current_results():
        if not loaded_datasets:
            print('No data to save.')
            return

        last_dataset_name = list(loaded_datasets.keys())[-1]
        last_dataset = loaded_datasets[last_dataset_name]

        os.makedirs('output', exist_ok=True)

        save_filename = output_file
        if not was_saved:
            timestamp = time.strftime('%Y%m%d_%H%M%S')
            save_filename = f'emergency_save_{timestamp}.json'

        dataset_dir = os.path.join('output', os.path.splitext(save_filename)[0])
        json_path = os.path.join('output', save_filename)

        if os.path.exists(dataset_dir):
            print(f'Dataset already saved to {dataset_dir}, skipping.')
            return

        print(f'Saving dataset {last_dataset_name} to {dataset_dir}...')
        try:
            last_dataset.save_to_disk(dataset_dir)
            with open(json_path, 'w', encoding='utf-8') as f:
                json.dump([dict(item) for item in last_dataset], f, ensure_ascii=False, indent=2)
            print(f'Saved {last_dataset.num_rows} records to {dataset_dir} and {json_path}')
        except Exception as e:
            print(f'Error saving results: {e}', file=sys.stderr)

    def render_prompt(template, template_fields, item):
        prompt = template
        for name in template_fields:
            if name in item:
                prompt = prompt.replace('{' + name + '}', str(item[name]))
        return prompt

    async def call_llm_async(prompt, model_name, temperature, max_tokens, semaphore, system_prompt=None):
        client = None
        async with semaphore:
            try:
                if debug:
                    print(f'Request to model {model_name} with temperature {temperature}')
                    print(f'Prompt: {prompt[:100]}')
                    if system_prompt:
                        print(f'System prompt: {system_prompt[:100]}')

                client = AsyncOpenAI(api_key=api_key, base_url=api_url if api_url else None)

                messages = []
                if system_prompt:
                    messages.append({'role': 'system', 'content': system_prompt})
                messages.append({'role': 'user', 'content': prompt})

                response = await client.chat.completions.create(
                    model=model_name,
                    messages=messages,
                    temperature=temperature,
                    max_tokens=max_tokens,
                    timeout=20,
                )
                return response.choices[0].message.content.strip()
            except Exception as e:
                error_msg = str(e)
                print(f'Error calling the LLM API: {error_msg}', file=sys.stderr)
                return f'[Generation error: {error_msg}]'
            finally:
                if client is not None and hasattr(client, 'close'):
                    try:
                        await client.close()
                    except Exception:
                        pass

    async def process_item_async(item, source_field, target_field, model_name, temperature,
                                 max_tokens, prompt_name, semaphore, pbar=None):
        try:
            if shutdown:
                return item

            item_dict = dict(item)
            system_prompt = None
            if prompt_name is not None and prompt_name in system_prompts:
                system_prompt = system_prompts[prompt_name]

            if prompt_name is not None and prompt_name in prompt_templates:
                entry = prompt_templates[prompt_name]
                prompt = render_prompt(entry['template'], entry['fields'], item_dict)
            elif source_field in item_dict:
                prompt = str(item_dict[source_field])
            else:
                print(f'Warning: field {source_field} is missing in record')
                prompt = ''

            item_dict[target_field] = await call_llm_async(
                prompt, model_name, temperature, max_tokens, semaphore, system_prompt)
            return item_dict
        except Exception as e:
            print(f'Error processing record: {e}', file=sys.stderr)
            return item
        finally:
            if pbar is not None:
                pbar.update(1)

    async def generate_content_async(dataset, source_field, target_field, model_name=None,
                                     temperature=0.7, max_tokens=1024, prompt_name=None):
        if model_name is None:
            if model is None:
                print('Error: model not specified for generation', file=sys.stderr)
                return dataset
            model_name = model

        if api_key is None:
            print('Error: API key not specified', file=sys.stderr)
            return dataset

        print(f'Generating field {target_field} from {source_field} using model {model_name}...')

        processed_items = []
        try:
            semaphore = asyncio.Semaphore(concurrency)

            if debug:
                sample_size = min(5, len(dataset))
                dataset_sample = dataset.select(range(sample_size))
            else:
                sample_size = len(dataset)
                dataset_sample = dataset

            print(f'Processing {sample_size} records...')
            all_items = list(dataset_sample)
            pbar = tqdm(total=sample_size, desc='Generation')

            batch_size = max(1, min(100, sample_size))
            for i in range(0, sample_size, batch_size):
                if shutdown:
                    print('\nStopping processing due to signal')
                    break

                current_batch = all_items[i:min(i + batch_size, sample_size)]
                batch_tasks = [
                    asyncio.create_task(process_item_async(
                        item, source_field, target_field, model_name,
                        temperature, max_tokens, prompt_name, semaphore, pbar))
                    for item in current_batch
                ]
                processed_items.extend(await asyncio.gather(*batch_tasks))

                if shutdown:
                    print('\nStopping after the current batch...')
                    break

            pbar.close()
            print('Generation completed.')
            if len(processed_items) < sample_size:
                print(f'Processed {len(processed_items)} of {sample_size} records (interrupted)')
            return Dataset.from_list([dict(item) for item in processed_items])
        except Exception as e:
            print(f'Error generating content: {e}', file=sys.stderr)
            if processed_items:
                print(f'Keeping {len(processed_items)} processed records...')
                return Dataset.from_list([dict(item) for item in processed_items])
            return dataset

    def generate_content(dataset, source_field, target_field, model_name=None,
                         temperature=0.7, max_tokens=1024, prompt_name=None):
        loop = asyncio.new_event_loop()
        asyncio.set_event_loop(loop)
        try:
            def handle_loop_signal():
                for task in asyncio.all_tasks(loop):
                    task.cancel()

            # PRAGMA AUTOSAVE owns SIGINT once it has been registered.
            if not shutdown and not sigint_handler_registered:
                loop.add_signal_handler(signal.SIGINT, handle_loop_signal)

            return loop.run_until_complete(generate_content_async(
                dataset, source_field, target_field, model_name, temperature, max_tokens,
                prompt_name))
        except (KeyboardInterrupt, asyncio.CancelledError):
            print('\nGeneration interrupted.')
            return dataset
        finally:
            try:
                pending = asyncio.all_tasks(loop)
                for task in pending:
                    task.cancel()
                if pending:
                    loop.run_until_complete(asyncio.gather(*pending, return_exceptions=True))
            except Exception:
                pass
            loop.close()

    def resolve_field(record, dotted_key):
        value = record
        for part in dotted_key.split('.'):
            if not isinstance(value, dict) or part not in value:
                return None
            value = value[part]
        return value

    def matches_filters(record, active_filters):
        for key, condition in active_filters.items():
            value = resolve_field(record, key)
            if value is None:
                return False
            try:
                if not OPS[condition['op']](value, condition['value']):
                    return False
            except TypeError:
                return False
        return True

    def load_dataset_with_config(name, streaming=False, fields=None, filters=None):
        print(f'Loading dataset {name}...')
        ds = load_dataset(name, streaming=streaming)

        if isinstance(ds, dict) and 'train' in ds:
            if debug:
                print('Selecting the train split')
            ds = ds['train']

        if filters:
            if debug:
                print(f'Applying filters: {filters}')
            active_filters = dict(filters)
            ds = ds.filter(lambda record: matches_filters(record, active_filters))

        if fields:
            if debug:
                print(f'Selecting fields: {fields}')
            ds = ds.select_columns(list(fields))

        return ds

)PY";

}  // namespace

std::string_view python_prelude() noexcept { return k_prelude; }

}  // namespace syn_dsl::codegen
